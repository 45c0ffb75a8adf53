#pragma once

#include "ReproVM/Core/interfaces/ICommandBuilderBase.hpp"
#include "ReproVM/Virtualization/vm/VirtualMachineNic.hpp"
#include "ReproVM/Virtualization/vmm/VirtualMachineConfig.hpp"
#include <filesystem>
#include <optional>
#include <string_view>

namespace ReproVM {

enum class RunMode { Install, Run, Snapshot };

[[nodiscard]] std::string_view toString(RunMode mode) noexcept;

// Resolved artifact paths for one launch.
struct LaunchResources {
    std::filesystem::path hypervisor;
    std::filesystem::path firmwareCode;
    std::filesystem::path variableStore;   // persistent store, or the install scratch copy
    std::filesystem::path disk;            // base disk for install, overlay otherwise
    std::filesystem::path installMedium;   // install only
    std::filesystem::path pidFile;
};

// Host facts the argument list depends on, probed once by the caller.
struct HostCapabilities {
    bool acceleration{false};
    bool audio{false};
    std::optional<std::filesystem::path> packageCache;
};

/**
 * @brief Concrete builder for the hypervisor argument list
 *
 * Fluent setters collect the launch description; build() renders it in a
 * fixed order. Firmware code is always rendered before the variable store.
 */
class VirtualMachineBuilder : public ICommandBuilderBase {
private:
    std::filesystem::path emulator;
    std::string name;
    std::string memory;
    unsigned int vcpuCount{0};
    std::filesystem::path firmwareCode;
    std::filesystem::path variableStore;
    std::filesystem::path diskPath;
    RunMode mode{RunMode::Run};
    std::filesystem::path installMedium;
    std::optional<VirtualMachineNic> nic;
    bool acceleration{false};
    bool audio{false};
    std::optional<std::filesystem::path> packageCache;
    std::filesystem::path pidFile;

    /**
     * @brief Renders all sections in order
     */
    void buildArguments() override;

    // Helper methods for building specific sections
    void buildMachineSection();
    void buildFirmwareSection();
    void buildDevicesSection();
    void buildDiskSection();
    void buildAudioSection();
    void buildShareSection();

public:
    VirtualMachineBuilder() = default;
    ~VirtualMachineBuilder() override = default;

    // Builder methods with fluent interface
    VirtualMachineBuilder& setEmulator(const std::filesystem::path& path);
    VirtualMachineBuilder& setName(std::string_view name);
    VirtualMachineBuilder& setMemory(std::string_view memory);
    VirtualMachineBuilder& setCpuCount(unsigned int vcpus);
    VirtualMachineBuilder& setFirmware(const std::filesystem::path& code, const std::filesystem::path& vars);
    VirtualMachineBuilder& setDisk(const std::filesystem::path& disk, RunMode mode);
    VirtualMachineBuilder& setInstallMedium(const std::filesystem::path& medium);
    VirtualMachineBuilder& setNic(const VirtualMachineNic& nic);
    VirtualMachineBuilder& setAcceleration(bool enabled);
    VirtualMachineBuilder& setAudio(bool enabled);
    VirtualMachineBuilder& setPackageCache(const std::optional<std::filesystem::path>& dir);
    VirtualMachineBuilder& setPidFile(const std::filesystem::path& path);
};

/**
 * @brief Pure mapping (mode, resources, config, host) -> argument list
 *
 * argv[0] is the hypervisor binary. Install targets the base disk and boots
 * the medium first; run and snapshot target the overlay. Snapshot opens the
 * overlay and the variable store with discard-on-exit semantics.
 */
[[nodiscard]] std::vector<std::string> buildHypervisorCommand(RunMode mode,
                                                              const LaunchResources& resources,
                                                              const VmConfig& cfg,
                                                              const HostCapabilities& host);

// ssh into the guest through the forwarded port, host keys not recorded.
[[nodiscard]] std::vector<std::string> buildSshCommand(const std::filesystem::path& ssh, int port,
                                                       const std::vector<std::string>& extra = {});

} // namespace ReproVM
