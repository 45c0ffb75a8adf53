#pragma once

#include "ReproVM/Core/interfaces/IHostEnvironment.hpp"
#include "ReproVM/Virtualization/vmm/VirtualMachineConfig.hpp"
#include <vector>

namespace ReproVM {

class HostEnvironment : public IHostEnvironment {
public:
    explicit HostEnvironment(const VmConfig& cfg, std::filesystem::path kvmDevice = "/dev/kvm");

    [[nodiscard]] Acceleration probeAcceleration() const override;
    [[nodiscard]] bool audioAvailable() const override;
    [[nodiscard]] bool isPortFree(int port) const override;
    [[nodiscard]] std::optional<std::filesystem::path> findExecutable(std::string_view name) const override;
    [[nodiscard]] std::optional<std::filesystem::path> packageCacheDir() const override;

private:
    std::vector<std::filesystem::path> searchPath_;
    std::filesystem::path cacheDir_;
    std::filesystem::path kvmDevice_;
};

} // namespace ReproVM
