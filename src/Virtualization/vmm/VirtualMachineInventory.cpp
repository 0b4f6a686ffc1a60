#include "Virtualization/vmm/VirtualMachineInventory.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Utils/Logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <map>

VirtualMachineInventory::VirtualMachineInventory(std::shared_ptr<HypervisorConnector> conn)
    : connector(std::move(conn)) {}

std::vector<VmSummary> VirtualMachineInventory::collect(unsigned int flags) {
    virDomainPtr* domains = nullptr;
    const int count = virConnectListAllDomains(connector->ensureConnected(), &domains, flags);
    if (count < 0) {
        throwLibvirtError("list domains", ErrorKind::Connection);
    }

    std::vector<VmSummary> out;
    out.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        const char* name = virDomainGetName(domains[i]);
        if (name) {
            VmSummary summary;
            summary.name = name;
            try {
                VirtualMachine vm(connector, summary.name);
                summary.status = vm.getStatus();
                if (summary.status == VmStatus::Running) {
                    summary.ip = vm.getPrimaryIPv4().value_or("unknown");
                }
            } catch (const LabException& e) {
                // فشل جهاز واحد لا يُسقط القائمة
                BoostLogger::Warn("Inventory: '{}' degraded: {}", summary.name, e.what());
                summary.status = VmStatus::Error;
            }
            out.push_back(std::move(summary));
        }
        virDomainFree(domains[i]);
    }
    free(domains);
    return out;
}

std::vector<VmSummary> VirtualMachineInventory::listVMs() {
    auto running = collect(VIR_CONNECT_LIST_DOMAINS_ACTIVE);
    auto defined = collect(VIR_CONNECT_LIST_DOMAINS_INACTIVE);
    BoostLogger::Debug("Inventory: {} running, {} defined", running.size(), defined.size());
    return merge(std::move(running), std::move(defined));
}

std::vector<VmSummary> VirtualMachineInventory::merge(std::vector<VmSummary> running,
                                                      std::vector<VmSummary> defined) {
    std::map<std::string, VmSummary> byName;
    for (auto& vm : defined) {
        auto name = vm.name;
        byName.insert_or_assign(std::move(name), std::move(vm));
    }
    for (auto& vm : running) {
        auto name = vm.name;
        byName.insert_or_assign(std::move(name), std::move(vm));
    }

    std::vector<VmSummary> merged;
    merged.reserve(byName.size());
    for (auto& [name, vm] : byName) {
        merged.push_back(std::move(vm));
    }
    return merged;
}
