#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "Core/interfaces/IHypervisorSession.hpp"
#include "Virtualization/snapshot/SnapshotManager.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/vmm/VirtualMachineInventory.hpp"

/**
 * @brief libvirt-backed hypervisor session.
 *
 * Closed on destruction; close() is idempotent.
 */
class HypervisorSession : public IHypervisorSession {
public:
    // يرمي ConnectionError
    [[nodiscard]] static std::unique_ptr<HypervisorSession> connect(const std::string& uri,
                                                                    std::chrono::seconds shutdownTimeout);

    HypervisorSession(std::shared_ptr<HypervisorConnector> conn, std::chrono::seconds shutdownTimeout);
    ~HypervisorSession() override;

    HypervisorSession(const HypervisorSession&) = delete;
    HypervisorSession& operator=(const HypervisorSession&) = delete;

    [[nodiscard]] VirtualMachine findVM(const std::string& name);
    [[nodiscard]] std::vector<VmSummary> listVMs();
    [[nodiscard]] SnapshotManager& snapshotManager() noexcept { return snapshots_; }
    [[nodiscard]] const std::string& uri() const noexcept;

    void close() noexcept override;
    [[nodiscard]] bool isOpen() const noexcept override;
    [[nodiscard]] RunState runState(const std::string& vm) override;
    bool ensureRunning(const std::string& vm) override;
    void powerOff(const std::string& vm, std::chrono::seconds timeout) override;
    [[nodiscard]] std::optional<std::string> getIP(const std::string& vm) override;
    [[nodiscard]] ISnapshotService& snapshots() override { return snapshots_; }

private:
    std::shared_ptr<HypervisorConnector> connector_;
    SnapshotManager snapshots_;
    VirtualMachineInventory inventory_;
};
