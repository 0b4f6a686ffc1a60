#pragma once
#include <libvirt/libvirt.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief One guest network interface with the IPv4 addresses it reports.
 */
class VirtualMachineNic {
public:
    VirtualMachineNic() = default;
    VirtualMachineNic(std::string name, std::string mac, std::vector<std::string> ipv4);

    [[nodiscard]] const std::string& getName() const noexcept;
    [[nodiscard]] const std::string& getMac() const noexcept;
    [[nodiscard]] const std::vector<std::string>& getAddresses() const noexcept;

    // العناوين من libvirt (الوكيل أو جدول DHCP حسب المصدر)
    [[nodiscard]] static std::vector<VirtualMachineNic> query(virDomainPtr domain, unsigned int source);

    // الرد على guest-network-get-interfaces
    [[nodiscard]] static std::vector<VirtualMachineNic> fromAgentReply(const nlohmann::json& ret);

    // يتجاهل lo و127.* و169.254.*
    [[nodiscard]] static bool isUsableIPv4(std::string_view address, std::string_view ifaceName = {}) noexcept;
    [[nodiscard]] static std::optional<std::string> primaryIPv4(const std::vector<VirtualMachineNic>& nics);

private:
    std::string name;
    std::string mac;
    std::vector<std::string> addresses;
};
