#pragma once

#include "ReproVM/Core/interfaces/IDiskImageTool.hpp"
#include "ReproVM/Core/interfaces/IPrompter.hpp"
#include "ReproVM/Virtualization/vm/VirtualMachineDisk.hpp"
#include "ReproVM/Virtualization/vmm/VirtualMachineConfig.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace ReproVM {

enum class ResourceKind { Firmware, BaseDisk, OverlayDisk, VariableStore, InstallMedium };

struct BaseDiskState {
    VirtualMachineDisk disk;
    bool created{false}; // created by this call
};

// Result of checking an existing overlay against its backing reference.
struct OverlayCheck {
    bool present{false};
    bool valid{false};
    std::optional<std::string> backingReference;
};

/**
 * @brief Brings the on-disk artifacts of one instance into existence
 *
 * Every ensure operation is idempotent: an artifact that already exists and
 * verifies is left alone. Destructive healing (firmware re-copy, overlay
 * recreation) happens only after the prompter confirms it.
 */
class ResourceProvisioner {
public:
    ResourceProvisioner(const VmConfig& cfg, InstanceLayout layout, IPrompter& prompter, IDiskImageTool& images);

    /**
     * @brief Dispatches to the ensure operation for kind
     * @return Path of the artifact
     */
    [[nodiscard]] Result<std::filesystem::path> ensure(ResourceKind kind);

    /**
     * @brief Firmware code image and variable template in the shared directory
     *
     * Verifies the code image against its hash record when one exists. When
     * the firmware is absent it is copied from the first host directory that
     * carries OVMF_CODE.4m.fd, then OVMF_CODE.fd.
     */
    [[nodiscard]] Result<std::filesystem::path> ensureFirmware();

    [[nodiscard]] Result<BaseDiskState> ensureBaseDisk();

    // Allocated size below the configured threshold: nothing installed yet.
    [[nodiscard]] bool baseLooksEmpty(const VirtualMachineDisk& base) const noexcept;

    [[nodiscard]] Result<std::filesystem::path> ensureOverlayDisk();

    [[nodiscard]] Result<OverlayCheck> validateOverlay() const;

    [[nodiscard]] Result<std::filesystem::path> ensureVariableStore();

    // Fresh copy of the variable template for an install session.
    [[nodiscard]] Result<void> copyVariableTemplate(const std::filesystem::path& destination) const;

    // *.iso files under the configured media directories.
    [[nodiscard]] std::vector<std::filesystem::path> findInstallMedia() const;

    /**
     * @brief Explicit medium if it exists, otherwise a discovered or typed one
     *
     * Zero candidates ask for a path, one is offered for confirmation, many
     * are presented as a list with a manual-entry option.
     */
    [[nodiscard]] Result<std::filesystem::path> resolveInstallMedium();

    [[nodiscard]] const InstanceLayout& layout() const noexcept { return paths; }

private:
    const VmConfig& cfg;
    InstanceLayout paths;
    IPrompter& prompter;
    IDiskImageTool& images;

    [[nodiscard]] std::optional<std::filesystem::path> findHostFirmware() const;
    [[nodiscard]] Result<void> installFirmware(const std::filesystem::path& hostCode);
    [[nodiscard]] Result<std::filesystem::path> askMediumPath();
    [[nodiscard]] std::filesystem::path expandHome(const std::string& text) const;
};

[[nodiscard]] std::string_view toString(ResourceKind kind) noexcept;

} // namespace ReproVM
