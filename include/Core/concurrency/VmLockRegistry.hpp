#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace CONCURRENCY {

/**
 * @brief Process-wide registry of one mutex per VM.
 *
 * Held only around snapshot-mutating hypervisor calls.
 */
class VmLockRegistry {
public:
    static VmLockRegistry& instance();

    [[nodiscard]] std::unique_lock<std::mutex> acquire(const std::string& vmKey);

    VmLockRegistry(const VmLockRegistry&) = delete;
    VmLockRegistry& operator=(const VmLockRegistry&) = delete;

private:
    VmLockRegistry() = default;

    std::mutex registryMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace CONCURRENCY
