#pragma once
#include <atomic>
#include <memory>

namespace CONCURRENCY {

// علم إلغاء مشترك بين المُجدول والمهمة
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

[[nodiscard]] inline CancelFlag makeCancelFlag() {
    return std::make_shared<std::atomic<bool>>(false);
}

[[nodiscard]] inline bool isCancelled(const CancelFlag& flag) noexcept {
    return flag && flag->load();
}

} // namespace CONCURRENCY
