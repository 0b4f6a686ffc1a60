#pragma once
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

// none -> creating -> present -> (reverting -> present) -> deleting -> none
enum class SnapshotState { None, Creating, Present, Reverting, Deleting };

[[nodiscard]] std::string_view toString(SnapshotState state) noexcept;

class SnapshotStateTracker {
public:
    [[nodiscard]] static bool isValidTransition(SnapshotState from, SnapshotState to) noexcept;

    [[nodiscard]] SnapshotState get(const std::string& vm, const std::string& name) const;

    // يرمي SnapshotOperationError عند انتقال غير مسموح
    void transition(const std::string& vm, const std::string& name, SnapshotState to);

    // لقطة موجودة أنشئت خارج هذه العملية
    void adopt(const std::string& vm, const std::string& name);

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, SnapshotState> states_;
};
