#include "ReproVM/Virtualization/vm/VirtualMachineNic.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ReproVM {

VirtualMachineNic::VirtualMachineNic(std::string m, int port) : mac(std::move(m)), hostSshPort(port) {
    if (!isValidMac(mac)) throw std::invalid_argument("invalid MAC address: " + mac);
    std::transform(mac.begin(), mac.end(), mac.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
}

bool VirtualMachineNic::isValidMac(std::string_view m) noexcept {
    if (m.size() != 17) return false;
    for (std::size_t i = 0; i < m.size(); ++i) {
        const auto c = static_cast<unsigned char>(m[i]);
        if (i % 3 == 2) {
            if (c != ':') return false;
        } else if (!std::isxdigit(c)) {
            return false;
        }
    }
    // multicast bit must be clear for a NIC address
    const int first = std::stoi(std::string(m.substr(0, 2)), nullptr, 16);
    return (first & 0x01) == 0;
}

} // namespace ReproVM
