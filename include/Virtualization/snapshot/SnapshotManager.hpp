#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <libvirt/libvirt.h>
#include "Core/interfaces/ISnapshotService.hpp"
#include "Virtualization/snapshot/SnapshotStateTracker.hpp"
#include "Virtualization/vm/VirtualMachine.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"

/**
 * @brief External (disk-only) snapshot lifecycle for libvirt domains.
 *
 * Mutating calls hold the per-VM lock from CONCURRENCY::VmLockRegistry
 * for their whole duration.
 */
class SnapshotManager : public ISnapshotService {
public:
    SnapshotManager(std::shared_ptr<HypervisorConnector> conn, std::chrono::seconds shutdownTimeout);
    ~SnapshotManager() override = default;

    SnapshotManager(const SnapshotManager&) = delete;
    SnapshotManager& operator=(const SnapshotManager&) = delete;

    SnapshotInfo createExternal(VirtualMachine& vm, const std::string& name,
                                const std::string& description, bool freezeFs);
    void revert(VirtualMachine& vm, const std::string& name);
    SnapshotDeleteOutcome remove(VirtualMachine& vm, const std::string& name);
    [[nodiscard]] std::vector<SnapshotInfo> list(VirtualMachine& vm);

    SnapshotInfo createExternal(const std::string& vm, const std::string& name,
                                const std::string& description, bool freezeFs) override;
    void revert(const std::string& vm, const std::string& name) override;
    SnapshotDeleteOutcome remove(const std::string& vm, const std::string& name) override;
    [[nodiscard]] std::vector<SnapshotInfo> list(const std::string& vm) override;

    [[nodiscard]] const SnapshotStateTracker& tracker() const noexcept { return tracker_; }

    // ملفات غير موجودة محليًا من القائمة
    [[nodiscard]] static std::vector<std::string> missingFiles(const std::vector<std::string>& files);
    // SnapshotOperationError اذا لم تُنشأ كل ملفات الطبقة الجديدة
    static void verifyBackingFiles(const std::string& vm, const std::string& name,
                                   const std::vector<std::string>& files);
    // qemu:///system محلي، qemu+ssh://host/system بعيد
    [[nodiscard]] static bool isLocalUri(const std::string& uri) noexcept;

private:
    using SnapshotPtr = std::unique_ptr<virDomainSnapshot, decltype(&virDomainSnapshotFree)>;

    std::shared_ptr<HypervisorConnector> connector;
    std::chrono::seconds shutdownTimeout;
    SnapshotStateTracker tracker_;

    [[nodiscard]] std::string lockKey(const VirtualMachine& vm) const;
    [[nodiscard]] SnapshotPtr lookup(const VirtualMachine& vm, const std::string& name) const;
    [[nodiscard]] bool exists(const VirtualMachine& vm, const std::string& name) const;
    [[nodiscard]] static std::string describe(virDomainSnapshotPtr snap);
};
