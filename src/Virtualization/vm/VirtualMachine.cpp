#include "Virtualization/vm/VirtualMachine.hpp"
#include "Virtualization/vm/GuestAgent.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Utils/Logger.hpp"
#include <cstdlib>
#include <thread>

std::string_view toString(RunState state) noexcept {
    switch (state) {
        case RunState::Defined: return "defined";
        case RunState::Running: return "running";
        case RunState::Shutoff: return "shutoff";
    }
    return "defined";
}

std::string_view toString(VmStatus status) noexcept {
    switch (status) {
        case VmStatus::Running: return "running";
        case VmStatus::Stopped: return "stopped";
        case VmStatus::Error:   return "error";
    }
    return "error";
}

VirtualMachine::VirtualMachine(std::shared_ptr<HypervisorConnector> conn, std::string_view vmName)
    : connector(std::move(conn)), name(vmName) {
    if (!connector) {
        throw ConnectionError("no hypervisor connection for VM " + name);
    }
    domain = virDomainLookupByName(connector->ensureConnected(), name.c_str());
    if (!domain) {
        const auto err = LibvirtError::last();
        if (err.is(VIR_ERR_NO_DOMAIN)) {
            throw NotFoundError("VM not found: " + name);
        }
        throwLibvirtError("lookup of VM " + name, ErrorKind::Connection);
    }
}

VirtualMachine::VirtualMachine(VirtualMachine&& other) noexcept
    : connector(std::move(other.connector)), domain(other.domain), name(std::move(other.name)) {
    other.domain = nullptr;
}

VirtualMachine::~VirtualMachine() {
    if (domain) virDomainFree(domain);
}

void VirtualMachine::start() { checkLibvirtError(virDomainCreate(domain), "start"); }
void VirtualMachine::resume() { checkLibvirtError(virDomainResume(domain), "resume"); }
void VirtualMachine::shutdown() { checkLibvirtError(virDomainShutdown(domain), "shutdown"); }
void VirtualMachine::destroy() { checkLibvirtError(virDomainDestroy(domain), "destroy"); }

void VirtualMachine::powerOff(std::chrono::seconds timeout) {
    if (!isActive()) return;

    BoostLogger::Info("Shutting down VM '{}' (timeout {}s)", name, timeout.count());
    if (virDomainShutdown(domain) < 0) {
        BoostLogger::Warn("Graceful shutdown of '{}' refused: {}", name, LibvirtError::last().message);
    } else {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!isActive()) {
                BoostLogger::Info("VM '{}' shut down gracefully", name);
                return;
            }
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        BoostLogger::Warn("VM '{}' did not shut down within {}s, forcing power off", name, timeout.count());
    }

    if (isActive()) {
        destroy();
    }
}

const std::string& VirtualMachine::getName() const noexcept { return name; }

RunState VirtualMachine::getState() const {
    int s = VIR_DOMAIN_NOSTATE;
    if (virDomainGetState(domain, &s, nullptr, 0) < 0) {
        throwLibvirtError("state of VM " + name, ErrorKind::Connection);
    }
    return mapLibvirtState(s);
}

VmStatus VirtualMachine::getStatus() const noexcept {
    int s = VIR_DOMAIN_NOSTATE;
    if (virDomainGetState(domain, &s, nullptr, 0) < 0) return VmStatus::Error;
    if (s == VIR_DOMAIN_CRASHED) return VmStatus::Error;
    return mapLibvirtState(s) == RunState::Running ? VmStatus::Running : VmStatus::Stopped;
}

bool VirtualMachine::isActive() const {
    const int rc = virDomainIsActive(domain);
    if (rc < 0) {
        throwLibvirtError("activity check of VM " + name, ErrorKind::Connection);
    }
    return rc == 1;
}

bool VirtualMachine::isPaused() const {
    int s = VIR_DOMAIN_NOSTATE;
    if (virDomainGetState(domain, &s, nullptr, 0) < 0) {
        throwLibvirtError("state of VM " + name, ErrorKind::Connection);
    }
    return s == VIR_DOMAIN_PAUSED;
}

std::string VirtualMachine::getXMLDesc(unsigned int flags) const {
    char* xml = virDomainGetXMLDesc(domain, flags);
    if (!xml) {
        throwLibvirtError("XML description of VM " + name, ErrorKind::Connection);
    }
    std::string out(xml);
    free(xml);
    return out;
}

std::optional<std::string> VirtualMachine::getPrimaryIPv4(std::chrono::seconds agentTimeout) const {
    if (!isActive()) return std::nullopt;

    try {
        GuestAgent agent(domain, agentTimeout);
        if (auto ip = VirtualMachineNic::primaryIPv4(agent.interfaces())) {
            BoostLogger::Debug("IP of '{}' from guest agent: {}", name, *ip);
            return ip;
        }
    } catch (const LabException& e) {
        BoostLogger::Debug("Guest agent address query for '{}' failed: {}", name, e.what());
    }

    if (auto ip = VirtualMachineNic::primaryIPv4(
            VirtualMachineNic::query(domain, VIR_DOMAIN_INTERFACE_ADDRESSES_SRC_LEASE))) {
        BoostLogger::Debug("IP of '{}' from DHCP leases: {}", name, *ip);
        return ip;
    }
    return std::nullopt;
}

virDomainPtr VirtualMachine::getRawHandle() const noexcept { return domain; }

const std::shared_ptr<HypervisorConnector>& VirtualMachine::getConnector() const noexcept { return connector; }

void VirtualMachine::checkLibvirtError(int result, const std::string& action) const {
    if (result < 0) {
        throwLibvirtError(action + " of VM " + name, ErrorKind::Connection);
    }
}

RunState VirtualMachine::mapLibvirtState(int state) noexcept {
    switch (state) {
        case VIR_DOMAIN_RUNNING:
        case VIR_DOMAIN_BLOCKED:
        case VIR_DOMAIN_PAUSED:
        case VIR_DOMAIN_SHUTDOWN:
        case VIR_DOMAIN_PMSUSPENDED:
            return RunState::Running;
        case VIR_DOMAIN_SHUTOFF:
        case VIR_DOMAIN_CRASHED:
            return RunState::Shutoff;
        default:
            return RunState::Defined;
    }
}
