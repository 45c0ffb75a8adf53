#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "ReproVM/Utils/Result.hpp"

namespace ReproVM {

// Per-launch bookkeeping the launcher must honour.
struct LaunchSession {
    std::filesystem::path pidFile;
    std::optional<std::filesystem::path> scratchVars; // removed once the hypervisor exits
    bool supervise{false};
};

/**
 * @brief Starts the hypervisor described by an argument list
 */
class IHypervisorLauncher {
public:
    virtual ~IHypervisorLauncher() = default;

    /// Resolves the hypervisor binary; Fatal with install hints when absent
    [[nodiscard]] virtual Result<std::filesystem::path> locate() = 0;

    /**
     * @brief Runs argv as the instance's hypervisor
     *
     * In process-replacement mode this only returns on failure. In supervise
     * mode it returns the hypervisor's exit status.
     */
    [[nodiscard]] virtual Result<int> launch(const std::vector<std::string>& argv, const LaunchSession& session) = 0;
};

} // namespace ReproVM
