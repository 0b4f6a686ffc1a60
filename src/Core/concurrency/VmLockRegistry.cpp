#include "Core/concurrency/VmLockRegistry.hpp"

namespace CONCURRENCY {

VmLockRegistry& VmLockRegistry::instance() {
    static VmLockRegistry registry;
    return registry;
}

std::unique_lock<std::mutex> VmLockRegistry::acquire(const std::string& vmKey) {
    std::shared_ptr<std::mutex> vmMutex;
    {
        std::scoped_lock lock(registryMutex_);
        auto& slot = locks_[vmKey];
        if (!slot) slot = std::make_shared<std::mutex>();
        vmMutex = slot;
    }
    // الإدخالات لا تُحذف، فيبقى الـ mutex حيًا
    return std::unique_lock<std::mutex>(*vmMutex);
}

} // namespace CONCURRENCY
