#include "ReproVM/Virtualization/builder/VirtualMachineNicBuilder.hpp"
#include <stdexcept>

namespace ReproVM {

void VirtualMachineNicBuilder::buildArguments() {
    if (!nic) throw std::logic_error("VirtualMachineNicBuilder: no NIC configured");

    add("-netdev", "user,id=" + nic->id() + ",hostfwd=tcp::" + std::to_string(nic->hostPort()) +
                       "-:" + std::to_string(nic->guestPort()));
    add("-device", nic->model() + ",netdev=" + nic->id() + ",mac=" + nic->getMac());
}

VirtualMachineNicBuilder& VirtualMachineNicBuilder::setNic(const VirtualMachineNic& n) {
    nic = n;
    return *this;
}

} // namespace ReproVM
