#include "Virtualization/snapshot/SnapshotStateTracker.hpp"
#include "Utils/Exception.hpp"
#include <fmt/format.h>

std::string_view toString(SnapshotState state) noexcept {
    switch (state) {
        case SnapshotState::None:      return "none";
        case SnapshotState::Creating:  return "creating";
        case SnapshotState::Present:   return "present";
        case SnapshotState::Reverting: return "reverting";
        case SnapshotState::Deleting:  return "deleting";
    }
    return "none";
}

bool SnapshotStateTracker::isValidTransition(SnapshotState from, SnapshotState to) noexcept {
    switch (from) {
        case SnapshotState::None:
            return to == SnapshotState::Creating;
        case SnapshotState::Creating:
            // الفشل يعيد إلى none
            return to == SnapshotState::Present || to == SnapshotState::None;
        case SnapshotState::Present:
            return to == SnapshotState::Reverting || to == SnapshotState::Deleting;
        case SnapshotState::Reverting:
            return to == SnapshotState::Present;
        case SnapshotState::Deleting:
            return to == SnapshotState::None || to == SnapshotState::Present;
    }
    return false;
}

SnapshotState SnapshotStateTracker::get(const std::string& vm, const std::string& name) const {
    std::scoped_lock lock(mutex_);
    const auto it = states_.find({vm, name});
    return it == states_.end() ? SnapshotState::None : it->second;
}

void SnapshotStateTracker::transition(const std::string& vm, const std::string& name, SnapshotState to) {
    std::scoped_lock lock(mutex_);
    const auto key = std::make_pair(vm, name);
    const auto it = states_.find(key);
    const auto from = it == states_.end() ? SnapshotState::None : it->second;

    if (!isValidTransition(from, to)) {
        throw SnapshotOperationError(fmt::format("snapshot '{}' of '{}': invalid transition {} -> {}",
                                                 name, vm, toString(from), toString(to)));
    }
    if (to == SnapshotState::None) {
        states_.erase(key);
    } else {
        states_[key] = to;
    }
}

void SnapshotStateTracker::adopt(const std::string& vm, const std::string& name) {
    std::scoped_lock lock(mutex_);
    states_.try_emplace({vm, name}, SnapshotState::Present);
}
