#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Utils/Logger.hpp"

HypervisorConnector::HypervisorConnector(std::string uri)
    : conn(nullptr), uri_(std::move(uri)) {}

HypervisorConnector::~HypervisorConnector() {
    close();
}

bool HypervisorConnector::connect() noexcept {
    std::scoped_lock lock(mutex_);
    if (conn) return true;
    conn = virConnectOpen(uri_.c_str());
    return conn != nullptr;
}

void HypervisorConnector::connectOrThrow() {
    if (!connect()) {
        const auto err = LibvirtError::last();
        BoostLogger::Error("Failed to connect to hypervisor '{}': {}", uri_, err.message);
        throw ConnectionError("connect to " + uri_ + " failed: " + err.message);
    }
    BoostLogger::Debug("Connected to hypervisor '{}'", uri_);
}

void HypervisorConnector::close() noexcept {
    std::scoped_lock lock(mutex_);
    if (conn) {
        virConnectClose(conn);
        conn = nullptr;
    }
}

virConnectPtr HypervisorConnector::getRawHandle() const noexcept {
    std::scoped_lock lock(mutex_);
    return conn;
}

virConnectPtr HypervisorConnector::ensureConnected() {
    {
        std::scoped_lock lock(mutex_);
        if (conn) return conn;
    }
    connectOrThrow();
    return getRawHandle();
}

bool HypervisorConnector::isConnected() const noexcept {
    std::scoped_lock lock(mutex_);
    return conn != nullptr;
}

const std::string& HypervisorConnector::getUri() const noexcept {
    return uri_;
}
