#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ReproVM/Core/interfaces/IDiskImageTool.hpp"
#include "ReproVM/Core/interfaces/IHostEnvironment.hpp"
#include "ReproVM/Core/interfaces/IHypervisorLauncher.hpp"
#include "ReproVM/Core/interfaces/IPrompter.hpp"
#include "ReproVM/System/Console.hpp"
#include "ReproVM/Virtualization/builder/VirtualMachineBuilder.hpp"
#include "ReproVM/Virtualization/Storage/ResourceProvisioner.hpp"
#include "ReproVM/Virtualization/vmm/InstanceLock.hpp"
#include "ReproVM/Virtualization/vmm/VirtualMachineConfig.hpp"

namespace ReproVM {

/**
 * @brief Lifecycle controller for one named instance
 *
 * Each command returns the process exit status on success and throws a
 * VmException subclass on failure. Launch commands in process-replacement
 * mode do not return.
 */
class VirtualMachineManager {
public:
    VirtualMachineManager(VmConfig& cfg,
                          std::shared_ptr<IPrompter> prompter,
                          std::shared_ptr<IHostEnvironment> host,
                          std::shared_ptr<IDiskImageTool> images,
                          std::shared_ptr<IHypervisorLauncher> launcher,
                          Console console);

    // Provision everything, switching to install while the base disk is empty.
    [[nodiscard]] int run();
    [[nodiscard]] int install();
    [[nodiscard]] int snapshot();

    // Deletes per-instance mutable state; base disk and firmware are preserved.
    [[nodiscard]] int reset();

    // Read-only.
    [[nodiscard]] int status();

    [[nodiscard]] int stop();
    [[nodiscard]] int ssh(const std::vector<std::string>& extra);

    [[nodiscard]] const InstanceLayout& layout() const noexcept { return paths; }

private:
    VmConfig& cfg;
    InstanceLayout paths;
    std::shared_ptr<IPrompter> prompter;
    std::shared_ptr<IHostEnvironment> host;
    std::shared_ptr<IDiskImageTool> images;
    std::shared_ptr<IHypervisorLauncher> launcher;
    Console console;
    ResourceProvisioner provisioner;

    struct Prerequisites {
        std::filesystem::path hypervisor;
        bool acceleration{false};
    };

    [[nodiscard]] Prerequisites checkPrerequisites();
    [[nodiscard]] bool checkAcceleration();
    void checkPort();

    [[nodiscard]] int installSession(const Prerequisites& pre, const std::filesystem::path& firmwareCode);
    [[nodiscard]] InstanceLock acquireLock();
    [[nodiscard]] std::filesystem::path scratchVariablePath() const;
    [[nodiscard]] int launch(RunMode mode, const LaunchResources& resources, bool acceleration,
                             std::optional<std::filesystem::path> scratchVars);

    void openLogFile();
    void printBanner(RunMode mode, const std::filesystem::path& medium);
};

} // namespace ReproVM
