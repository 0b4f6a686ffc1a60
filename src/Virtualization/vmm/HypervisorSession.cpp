#include "Virtualization/vmm/HypervisorSession.hpp"
#include "Utils/Logger.hpp"

std::unique_ptr<HypervisorSession> HypervisorSession::connect(const std::string& uri,
                                                              std::chrono::seconds shutdownTimeout) {
    auto conn = std::make_shared<HypervisorConnector>(uri);
    conn->connectOrThrow();
    BoostLogger::Info("Hypervisor session opened on '{}'", uri);
    return std::make_unique<HypervisorSession>(std::move(conn), shutdownTimeout);
}

HypervisorSession::HypervisorSession(std::shared_ptr<HypervisorConnector> conn, std::chrono::seconds shutdownTimeout)
    : connector_(std::move(conn)),
      snapshots_(connector_, shutdownTimeout),
      inventory_(connector_) {}

HypervisorSession::~HypervisorSession() {
    close();
}

VirtualMachine HypervisorSession::findVM(const std::string& name) {
    return VirtualMachine(connector_, name);
}

std::vector<VmSummary> HypervisorSession::listVMs() {
    return inventory_.listVMs();
}

const std::string& HypervisorSession::uri() const noexcept {
    return connector_->getUri();
}

void HypervisorSession::close() noexcept {
    if (connector_->isConnected()) {
        connector_->close();
        BoostLogger::Info("Hypervisor session on '{}' closed", connector_->getUri());
    }
}

bool HypervisorSession::isOpen() const noexcept {
    return connector_->isConnected();
}

RunState HypervisorSession::runState(const std::string& vm) {
    return findVM(vm).getState();
}

bool HypervisorSession::ensureRunning(const std::string& vm) {
    auto handle = findVM(vm);
    if (handle.isActive()) {
        if (handle.isPaused()) {
            BoostLogger::Info("Resuming paused VM '{}'", vm);
            handle.resume();
        } else {
            BoostLogger::Debug("VM '{}' already running", vm);
        }
        return true;
    }
    BoostLogger::Info("Starting VM '{}'", vm);
    handle.start();
    return true;
}

void HypervisorSession::powerOff(const std::string& vm, std::chrono::seconds timeout) {
    findVM(vm).powerOff(timeout);
}

std::optional<std::string> HypervisorSession::getIP(const std::string& vm) {
    return findVM(vm).getPrimaryIPv4();
}
