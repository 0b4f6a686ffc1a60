#include "Virtualization/vm/VirtualMachineNic.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Utils/Logger.hpp"
#include <cstdlib>

namespace {

// الوكيل قد يعيد أنواعا غير متوقعة؛ الحقل غير النصي يعامل كغائب
std::string stringMember(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : std::string();
}

} // namespace

VirtualMachineNic::VirtualMachineNic(std::string n, std::string m, std::vector<std::string> ipv4)
    : name(std::move(n)), mac(std::move(m)), addresses(std::move(ipv4)) {}

const std::string& VirtualMachineNic::getName() const noexcept { return name; }
const std::string& VirtualMachineNic::getMac() const noexcept { return mac; }
const std::vector<std::string>& VirtualMachineNic::getAddresses() const noexcept { return addresses; }

std::vector<VirtualMachineNic> VirtualMachineNic::query(virDomainPtr domain, unsigned int source) {
    std::vector<VirtualMachineNic> nics;
    if (!domain) return nics;

    virDomainInterfacePtr* ifaces = nullptr;
    const int count = virDomainInterfaceAddresses(domain, &ifaces, source, 0);
    if (count < 0) {
        BoostLogger::Debug("Interface query (source {}) failed: {}", source, LibvirtError::last().message);
        return nics;
    }

    for (int i = 0; i < count; ++i) {
        const virDomainInterfacePtr iface = ifaces[i];
        std::vector<std::string> ipv4;
        for (unsigned int j = 0; j < iface->naddrs; ++j) {
            if (iface->addrs[j].type == VIR_IP_ADDR_TYPE_IPV4 && iface->addrs[j].addr) {
                ipv4.emplace_back(iface->addrs[j].addr);
            }
        }
        nics.emplace_back(iface->name ? iface->name : "",
                          iface->hwaddr ? iface->hwaddr : "",
                          std::move(ipv4));
        virDomainInterfaceFree(iface);
    }
    free(ifaces);
    return nics;
}

std::vector<VirtualMachineNic> VirtualMachineNic::fromAgentReply(const nlohmann::json& ret) {
    std::vector<VirtualMachineNic> nics;
    if (!ret.is_array()) return nics;

    for (const auto& iface : ret) {
        if (!iface.is_object()) continue;
        std::vector<std::string> ipv4;
        if (const auto addrs = iface.find("ip-addresses"); addrs != iface.end() && addrs->is_array()) {
            for (const auto& addr : *addrs) {
                if (!addr.is_object() || stringMember(addr, "ip-address-type") != "ipv4") continue;
                if (auto ip = stringMember(addr, "ip-address"); !ip.empty()) ipv4.push_back(std::move(ip));
            }
        }
        nics.emplace_back(stringMember(iface, "name"), stringMember(iface, "hardware-address"), std::move(ipv4));
    }
    return nics;
}

bool VirtualMachineNic::isUsableIPv4(std::string_view address, std::string_view ifaceName) noexcept {
    if (address.empty() || ifaceName == "lo") return false;
    if (address.starts_with("127.") || address.starts_with("169.254.")) return false;
    return true;
}

std::optional<std::string> VirtualMachineNic::primaryIPv4(const std::vector<VirtualMachineNic>& nics) {
    for (const auto& nic : nics) {
        for (const auto& addr : nic.getAddresses()) {
            if (isUsableIPv4(addr, nic.getName())) {
                return addr;
            }
        }
    }
    return std::nullopt;
}
