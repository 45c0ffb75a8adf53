#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace ReproVM {

enum class Acceleration { Usable, Missing, NoPermission };

/**
 * @brief Read-only view of host capabilities
 *
 * Everything the lifecycle manager needs to know about the host that is not
 * one of its own artifacts goes through this interface.
 */
class IHostEnvironment {
public:
    virtual ~IHostEnvironment() = default;

    /// Hardware acceleration device state (readable and writable means usable)
    [[nodiscard]] virtual Acceleration probeAcceleration() const = 0;

    /// True when a PulseAudio-compatible server binary is installed
    [[nodiscard]] virtual bool audioAvailable() const = 0;

    /// True when nothing listens on the TCP port
    [[nodiscard]] virtual bool isPortFree(int port) const = 0;

    [[nodiscard]] virtual std::optional<std::filesystem::path> findExecutable(std::string_view name) const = 0;

    /// Host package cache shared read-only with the guest during install
    [[nodiscard]] virtual std::optional<std::filesystem::path> packageCacheDir() const = 0;
};

} // namespace ReproVM
