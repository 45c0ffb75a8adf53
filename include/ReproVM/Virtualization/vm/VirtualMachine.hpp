#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include "ReproVM/Utils/Result.hpp"

namespace ReproVM {

/**
 * @brief Handle on the hypervisor process of one instance
 *
 * The state is derived from the process identifier record on every call;
 * the handle itself caches nothing.
 */
class VirtualMachine {
public:
    enum class VmState { Running, Stale, Stopped };

    enum class StopOutcome {
        NotRunning,  ///< no record
        StaleRecord, ///< record named a dead process
        Graceful,    ///< exited after SIGTERM
        Forced       ///< needed SIGKILL
    };

    VirtualMachine(std::string_view vmName, std::filesystem::path pidFile, std::filesystem::path lockFile);

    VirtualMachine(const VirtualMachine&) = delete;
    VirtualMachine& operator=(const VirtualMachine&) = delete;

    [[nodiscard]] const std::string& getName() const noexcept;
    [[nodiscard]] VmState getState() const;
    [[nodiscard]] std::optional<pid_t> pid() const;
    [[nodiscard]] bool isActive() const;

    // SIGTERM
    [[nodiscard]] bool shutdown() const;
    // SIGKILL
    [[nodiscard]] bool destroy() const;

    /**
     * @brief Graceful stop with bounded escalation
     *
     * Sends SIGTERM, polls up to attempts times interval apart, then sends
     * SIGKILL. The PID and lock records are removed on every path.
     */
    [[nodiscard]] Result<StopOutcome> stop(int attempts, std::chrono::milliseconds interval);

    // Removes the PID and lock records.
    void clearRecords() const noexcept;

private:
    std::string name;
    std::filesystem::path pidFile;
    std::filesystem::path lockFile;

    [[nodiscard]] bool waitForExit(pid_t pid, int attempts, std::chrono::milliseconds interval) const;
};

[[nodiscard]] std::string_view toString(VirtualMachine::VmState state) noexcept;

} // namespace ReproVM
