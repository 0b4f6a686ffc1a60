#pragma once

#include <string>
#include <vector>
#include "Virtualization/snapshot/SnapshotDescriptor.hpp"

/**
 * @brief Snapshot operations addressed by VM name.
 *
 * Revert and remove raise NotFoundError for an unknown snapshot;
 * createExternal raises SnapshotOperationError for a duplicate name.
 */
class ISnapshotService {
public:
    virtual ~ISnapshotService() noexcept = default;

    virtual SnapshotInfo createExternal(const std::string& vm, const std::string& name,
                                        const std::string& description, bool freezeFs) = 0;
    virtual void revert(const std::string& vm, const std::string& name) = 0;
    virtual SnapshotDeleteOutcome remove(const std::string& vm, const std::string& name) = 0;
    [[nodiscard]] virtual std::vector<SnapshotInfo> list(const std::string& vm) = 0;
};
