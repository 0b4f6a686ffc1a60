#pragma once

#include <libvirt/libvirt.h>
#include <memory>
#include <string>
#include <mutex>

class HypervisorConnector {
public:
    HypervisorConnector() = delete;
    explicit HypervisorConnector(std::string uri);
    ~HypervisorConnector();

    HypervisorConnector(const HypervisorConnector&) = delete;
    HypervisorConnector& operator=(const HypervisorConnector&) = delete;

    // اتصال/إدارة مقبض libvirt
    bool connect() noexcept;
    void connectOrThrow();
    void close() noexcept;

    [[nodiscard]] virConnectPtr getRawHandle() const noexcept;
    [[nodiscard]] virConnectPtr ensureConnected();
    [[nodiscard]] bool isConnected() const noexcept;
    [[nodiscard]] const std::string& getUri() const noexcept;

private:
    mutable std::mutex mutex_;
    virConnectPtr conn{nullptr};
    std::string uri_;
};
