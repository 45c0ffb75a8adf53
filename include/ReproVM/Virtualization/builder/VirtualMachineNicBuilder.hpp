#pragma once

#include "ReproVM/Core/interfaces/ICommandBuilderBase.hpp"
#include "ReproVM/Virtualization/vm/VirtualMachineNic.hpp"
#include <optional>

namespace ReproVM {

/**
 * @brief Builder for the user-mode network backend and its NIC device
 *
 * Produces the -netdev/-device pair with a single host->guest port forward
 * and the instance's fixed hardware address.
 */
class VirtualMachineNicBuilder : public ICommandBuilderBase {
private:
    /**
     * @brief Builds the -netdev and -device arguments
     */
    void buildArguments() override;

    std::optional<VirtualMachineNic> nic;

public:
    VirtualMachineNicBuilder() = default;
    ~VirtualMachineNicBuilder() override = default;

    /**
     * @brief Sets the NIC to render
     * @param nic MAC address and forwarded SSH port
     */
    VirtualMachineNicBuilder& setNic(const VirtualMachineNic& nic);

    void reset() noexcept {
        ICommandBuilderBase::reset();
        nic.reset();
    }
};

} // namespace ReproVM
