#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Virtualization/vm/VirtualMachine.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"

struct VmSummary {
    std::string name;
    VmStatus status{VmStatus::Stopped};
    std::string ip{"unknown"};
};

/**
 * @brief Read-only listing of every domain known to the hypervisor.
 */
class VirtualMachineInventory {
public:
    explicit VirtualMachineInventory(std::shared_ptr<HypervisorConnector> conn);

    VirtualMachineInventory(const VirtualMachineInventory&) = delete;
    VirtualMachineInventory& operator=(const VirtualMachineInventory&) = delete;

    // قائمة مدمجة (تعمل + معرّفة)، بلا تكرار ومرتبة بالاسم
    [[nodiscard]] std::vector<VmSummary> listVMs();

    // العنصر الجاري يتغلب على المتوقف عند تكرار الاسم
    [[nodiscard]] static std::vector<VmSummary> merge(std::vector<VmSummary> running,
                                                      std::vector<VmSummary> defined);

private:
    std::shared_ptr<HypervisorConnector> connector;

    [[nodiscard]] std::vector<VmSummary> collect(unsigned int flags);
};
