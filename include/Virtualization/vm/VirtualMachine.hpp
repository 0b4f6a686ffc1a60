#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <libvirt/libvirt.h>
#include "Virtualization/vmm/HypervisorConnector.hpp"

enum class RunState { Defined, Running, Shutoff };

// الحالة كما تظهر في قائمة الأجهزة
enum class VmStatus { Running, Stopped, Error };

[[nodiscard]] std::string_view toString(RunState state) noexcept;
[[nodiscard]] std::string_view toString(VmStatus status) noexcept;

/**
 * @brief Owning handle to one libvirt domain, looked up by name.
 *
 * The domain definition itself is never created or undefined here; the
 * handle only observes and changes the power state.
 */
class VirtualMachine {
public:
    VirtualMachine(std::shared_ptr<HypervisorConnector> conn, std::string_view vmName);
    ~VirtualMachine();

    VirtualMachine(const VirtualMachine&) = delete;
    VirtualMachine& operator=(const VirtualMachine&) = delete;
    VirtualMachine(VirtualMachine&& other) noexcept;
    VirtualMachine& operator=(VirtualMachine&&) = delete;

    void start();
    void resume();
    void shutdown();
    void destroy();

    // إيقاف لطيف ثم قسري بعد انتهاء المهلة
    void powerOff(std::chrono::seconds timeout);

    [[nodiscard]] const std::string& getName() const noexcept;
    [[nodiscard]] RunState getState() const;
    [[nodiscard]] VmStatus getStatus() const noexcept;
    [[nodiscard]] bool isActive() const;
    // نشط لكن معلّق (VIR_DOMAIN_PAUSED)
    [[nodiscard]] bool isPaused() const;
    [[nodiscard]] std::string getXMLDesc(unsigned int flags = 0) const;
    // الوكيل أولاً ثم جدول DHCP؛ nullopt اذا لم يُبلّغ الضيف عن عنوان بعد
    [[nodiscard]] std::optional<std::string> getPrimaryIPv4(std::chrono::seconds agentTimeout = std::chrono::seconds(5)) const;
    [[nodiscard]] virDomainPtr getRawHandle() const noexcept;
    [[nodiscard]] const std::shared_ptr<HypervisorConnector>& getConnector() const noexcept;

    [[nodiscard]] static RunState mapLibvirtState(int state) noexcept;

private:
    std::shared_ptr<HypervisorConnector> connector;
    virDomainPtr domain{nullptr};
    std::string name;

    void checkLibvirtError(int result, const std::string& action) const;
};
