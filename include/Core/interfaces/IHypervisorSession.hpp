#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "Core/interfaces/ISnapshotService.hpp"
#include "Virtualization/vm/VirtualMachine.hpp"

/**
 * @brief One open connection to the hypervisor, owned by a single user.
 */
class IHypervisorSession {
public:
    virtual ~IHypervisorSession() noexcept = default;

    virtual void close() noexcept = 0;
    [[nodiscard]] virtual bool isOpen() const noexcept = 0;

    // NotFoundError اذا لم يوجد الجهاز
    [[nodiscard]] virtual RunState runState(const std::string& vm) = 0;
    // idempotent: لا يعيد التشغيل اذا كان الجهاز يعمل
    virtual bool ensureRunning(const std::string& vm) = 0;
    virtual void powerOff(const std::string& vm, std::chrono::seconds timeout) = 0;
    // std::nullopt تعني أن العنوان غير متاح بعد
    [[nodiscard]] virtual std::optional<std::string> getIP(const std::string& vm) = 0;

    [[nodiscard]] virtual ISnapshotService& snapshots() = 0;
};

using HypervisorSessionFactory = std::function<std::unique_ptr<IHypervisorSession>(const std::string& uri)>;
