#pragma once
#include <string>
#include <string_view>

namespace ReproVM {

// User-mode NIC of an instance: fixed MAC plus one host->guest SSH forward.
class VirtualMachineNic {
public:
    VirtualMachineNic(std::string mac, int hostSshPort);

    [[nodiscard]] static bool isValidMac(std::string_view mac) noexcept;

    [[nodiscard]] const std::string& getMac() const noexcept { return mac; }
    [[nodiscard]] int hostPort() const noexcept { return hostSshPort; }
    [[nodiscard]] int guestPort() const noexcept { return 22; }
    [[nodiscard]] const std::string& id() const noexcept { return netdevId; }
    [[nodiscard]] const std::string& model() const noexcept { return deviceModel; }

private:
    std::string mac;
    int hostSshPort;
    std::string netdevId{"net0"};
    std::string deviceModel{"virtio-net-pci"};
};

} // namespace ReproVM
