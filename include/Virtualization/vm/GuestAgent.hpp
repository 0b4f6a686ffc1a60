#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <libvirt/libvirt.h>
#include <nlohmann/json.hpp>
#include "Virtualization/vm/VirtualMachineNic.hpp"

/**
 * @brief QEMU guest agent channel of one domain (libvirt-qemu passthrough).
 */
class GuestAgent {
public:
    explicit GuestAgent(virDomainPtr domain, std::chrono::seconds timeout = std::chrono::seconds(10));

    GuestAgent(const GuestAgent&) = delete;
    GuestAgent& operator=(const GuestAgent&) = delete;

    // يرسل {"execute": name, "arguments": args} ويعيد حقل "return"
    nlohmann::json command(const std::string& execute, const nlohmann::json& arguments = nullptr);

    // عدد أنظمة الملفات المجمّدة/المُذابة
    int freeze();
    int thaw();

    [[nodiscard]] std::vector<VirtualMachineNic> interfaces();

    // يحلل رد الوكيل ويرمي AgentCommandError عند "error" أو JSON غير صالح
    [[nodiscard]] static nlohmann::json parseReply(const std::string& raw);
    // رد التجميد/الإذابة عدد صحيح؛ غير ذلك AgentCommandError
    [[nodiscard]] static int countFromReply(const nlohmann::json& ret, const std::string& execute);
    [[nodiscard]] static std::string buildCommand(const std::string& execute, const nlohmann::json& arguments);

private:
    virDomainPtr domain;
    std::chrono::seconds timeout;
};

/**
 * @brief Scoped filesystem freeze; destruction always attempts a thaw.
 *
 * A failed freeze is recorded instead of thrown so the caller can fall
 * back to another consistency mechanism.
 */
class FsFreezeGuard {
public:
    explicit FsFreezeGuard(GuestAgent& agent);
    ~FsFreezeGuard();

    FsFreezeGuard(const FsFreezeGuard&) = delete;
    FsFreezeGuard& operator=(const FsFreezeGuard&) = delete;

    [[nodiscard]] bool frozen() const noexcept { return frozen_; }
    [[nodiscard]] const std::string& failure() const noexcept { return failure_; }

private:
    GuestAgent& agent_;
    bool frozen_{false};
    std::string failure_;
};
