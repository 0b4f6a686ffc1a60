#include "Virtualization/snapshot/SnapshotManager.hpp"
#include "Virtualization/snapshot/SnapshotXmlBuilder.hpp"
#include "Virtualization/vm/GuestAgent.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Core/concurrency/VmLockRegistry.hpp"
#include "Utils/Logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <fmt/format.h>
#include <fmt/ranges.h>

SnapshotManager::SnapshotManager(std::shared_ptr<HypervisorConnector> conn, std::chrono::seconds timeout)
    : connector(std::move(conn)), shutdownTimeout(timeout) {}

std::string SnapshotManager::lockKey(const VirtualMachine& vm) const {
    return connector->getUri() + "#" + vm.getName();
}

SnapshotManager::SnapshotPtr SnapshotManager::lookup(const VirtualMachine& vm, const std::string& name) const {
    virDomainSnapshotPtr snap = virDomainSnapshotLookupByName(vm.getRawHandle(), name.c_str(), 0);
    if (!snap) {
        const auto err = LibvirtError::last();
        if (err.is(VIR_ERR_NO_DOMAIN_SNAPSHOT)) {
            throw NotFoundError(fmt::format("snapshot '{}' not found on '{}'", name, vm.getName()));
        }
        throwLibvirtError(fmt::format("lookup of snapshot '{}' on '{}'", name, vm.getName()),
                          ErrorKind::SnapshotOperation);
    }
    return SnapshotPtr(snap, &virDomainSnapshotFree);
}

bool SnapshotManager::exists(const VirtualMachine& vm, const std::string& name) const {
    try {
        [[maybe_unused]] auto snap = lookup(vm, name);
        return true;
    } catch (const NotFoundError&) {
        return false;
    }
}

std::string SnapshotManager::describe(virDomainSnapshotPtr snap) {
    char* xml = virDomainSnapshotGetXMLDesc(snap, 0);
    if (!xml) {
        throwLibvirtError("snapshot XML description", ErrorKind::SnapshotOperation);
    }
    std::string out(xml);
    free(xml);
    return out;
}

std::vector<std::string> SnapshotManager::missingFiles(const std::vector<std::string>& files) {
    std::vector<std::string> missing;
    for (const auto& f : files) {
        std::error_code ec;
        if (!std::filesystem::exists(f, ec)) {
            missing.push_back(f);
        }
    }
    return missing;
}

void SnapshotManager::verifyBackingFiles(const std::string& vm, const std::string& name,
                                         const std::vector<std::string>& files) {
    const auto missing = missingFiles(files);
    for (const auto& file : missing) {
        BoostLogger::Error("Snapshot '{}' of '{}': backing file missing: {}", name, vm, file);
    }
    if (!missing.empty()) {
        throw SnapshotOperationError(fmt::format("snapshot '{}' created but backing file(s) missing: {}",
                                                 name, fmt::join(missing, ", ")));
    }
}

bool SnapshotManager::isLocalUri(const std::string& uri) noexcept {
    const auto pos = uri.find("://");
    if (pos == std::string::npos) return true;
    return pos + 3 < uri.size() && uri[pos + 3] == '/';
}

SnapshotInfo SnapshotManager::createExternal(VirtualMachine& vm, const std::string& name,
                                             const std::string& description, bool freezeFs) {
    auto lock = CONCURRENCY::VmLockRegistry::instance().acquire(lockKey(vm));

    if (exists(vm, name)) {
        throw SnapshotOperationError(fmt::format("snapshot '{}' already exists on '{}'", name, vm.getName()));
    }
    tracker_.transition(vm.getName(), name, SnapshotState::Creating);

    bool submitted = false;
    try {
        SnapshotXmlBuilder builder;
        builder.setName(name)
               .setDomainName(vm.getName())
               .addDisks(SnapshotDescriptor::snapshotableDisks(vm.getXMLDesc()));

        unsigned int flags = VIR_DOMAIN_SNAPSHOT_CREATE_DISK_ONLY | VIR_DOMAIN_SNAPSHOT_CREATE_ATOMIC;
        auto submit = [&](const char* consistency) {
            builder.setDescription(fmt::format("{} [{}]", description, consistency));
            const auto xml = builder.build();
            BoostLogger::Debug("Snapshot XML for '{}':\n{}", vm.getName(), xml);
            return virDomainSnapshotCreateXML(vm.getRawHandle(), xml.c_str(), flags);
        };

        virDomainSnapshotPtr raw = nullptr;
        if (freezeFs && vm.isActive()) {
            GuestAgent agent(vm.getRawHandle());
            FsFreezeGuard guard(agent);
            if (guard.frozen()) {
                raw = submit("filesystem frozen via guest agent");
            } else {
                flags |= VIR_DOMAIN_SNAPSHOT_CREATE_QUIESCE;
                raw = submit("quiesced");
                if (!raw) {
                    BoostLogger::Warn("Quiesced snapshot of '{}' failed ({}), retrying crash-consistent",
                                      vm.getName(), LibvirtError::last().message);
                    flags &= ~static_cast<unsigned int>(VIR_DOMAIN_SNAPSHOT_CREATE_QUIESCE);
                    raw = submit("crash-consistent");
                }
            }
        } else {
            raw = submit("crash-consistent");
        }

        if (!raw) {
            throwLibvirtError(fmt::format("create snapshot '{}' on '{}'", name, vm.getName()),
                              ErrorKind::SnapshotOperation);
        }
        SnapshotPtr snap(raw, &virDomainSnapshotFree);
        submitted = true;
        tracker_.transition(vm.getName(), name, SnapshotState::Present);

        auto info = SnapshotDescriptor::parse(describe(snap.get()));
        const auto expected = builder.plannedFiles();
        if (isLocalUri(connector->getUri())) {
            verifyBackingFiles(vm.getName(), name, expected);
        }

        BoostLogger::Info("External snapshot '{}' created for '{}' ({} disk(s))", name, vm.getName(), expected.size());
        return info;
    } catch (const std::exception&) {
        if (!submitted) {
            tracker_.transition(vm.getName(), name, SnapshotState::None);
        }
        throw;
    }
}

void SnapshotManager::revert(VirtualMachine& vm, const std::string& name) {
    auto lock = CONCURRENCY::VmLockRegistry::instance().acquire(lockKey(vm));

    auto snap = lookup(vm, name);
    tracker_.adopt(vm.getName(), name);
    tracker_.transition(vm.getName(), name, SnapshotState::Reverting);

    try {
        vm.powerOff(shutdownTimeout);
        if (virDomainRevertToSnapshot(snap.get(), VIR_DOMAIN_SNAPSHOT_REVERT_FORCE) < 0) {
            throwLibvirtError(fmt::format("revert '{}' to snapshot '{}'", vm.getName(), name),
                              ErrorKind::SnapshotOperation);
        }
    } catch (const std::exception&) {
        tracker_.transition(vm.getName(), name, SnapshotState::Present);
        throw;
    }

    tracker_.transition(vm.getName(), name, SnapshotState::Present);
    BoostLogger::Info("Reverted '{}' to snapshot '{}'", vm.getName(), name);
}

SnapshotDeleteOutcome SnapshotManager::remove(VirtualMachine& vm, const std::string& name) {
    auto lock = CONCURRENCY::VmLockRegistry::instance().acquire(lockKey(vm));

    auto snap = lookup(vm, name);
    tracker_.adopt(vm.getName(), name);
    tracker_.transition(vm.getName(), name, SnapshotState::Deleting);

    SnapshotInfo info;
    try {
        info = SnapshotDescriptor::parse(describe(snap.get()));
        if (virDomainSnapshotDelete(snap.get(), VIR_DOMAIN_SNAPSHOT_DELETE_METADATA_ONLY) < 0) {
            throwLibvirtError(fmt::format("delete snapshot '{}' of '{}'", name, vm.getName()),
                              ErrorKind::SnapshotOperation);
        }
    } catch (const std::exception&) {
        tracker_.transition(vm.getName(), name, SnapshotState::Present);
        throw;
    }
    tracker_.transition(vm.getName(), name, SnapshotState::None);

    SnapshotDeleteOutcome outcome;
    outcome.metadataRemoved = true;
    outcome.retainedFiles = info.diskFiles;
    if (outcome.retainedFiles.empty()) {
        outcome.message = fmt::format("snapshot '{}' metadata removed", name);
    } else {
        outcome.message = fmt::format("snapshot '{}' metadata removed; {} backing file(s) left on disk "
                                      "and need manual cleanup: {}",
                                      name, outcome.retainedFiles.size(), fmt::join(outcome.retainedFiles, ", "));
    }
    BoostLogger::Info("{}", outcome.message);
    return outcome;
}

std::vector<SnapshotInfo> SnapshotManager::list(VirtualMachine& vm) {
    virDomainSnapshotPtr* snaps = nullptr;
    const int count = virDomainListAllSnapshots(vm.getRawHandle(), &snaps, 0);
    if (count < 0) {
        throwLibvirtError("list snapshots of " + vm.getName(), ErrorKind::SnapshotOperation);
    }

    std::vector<SnapshotPtr> owned;
    owned.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        owned.emplace_back(snaps[i], &virDomainSnapshotFree);
    }
    free(snaps);

    std::vector<SnapshotInfo> infos;
    infos.reserve(owned.size());
    for (const auto& snap : owned) {
        infos.push_back(SnapshotDescriptor::parse(describe(snap.get())));
    }
    std::sort(infos.begin(), infos.end(), [](const SnapshotInfo& a, const SnapshotInfo& b) {
        return a.creationTime != b.creationTime ? a.creationTime < b.creationTime : a.name < b.name;
    });
    return infos;
}

SnapshotInfo SnapshotManager::createExternal(const std::string& vm, const std::string& name,
                                             const std::string& description, bool freezeFs) {
    VirtualMachine handle(connector, vm);
    return createExternal(handle, name, description, freezeFs);
}

void SnapshotManager::revert(const std::string& vm, const std::string& name) {
    VirtualMachine handle(connector, vm);
    revert(handle, name);
}

SnapshotDeleteOutcome SnapshotManager::remove(const std::string& vm, const std::string& name) {
    VirtualMachine handle(connector, vm);
    return remove(handle, name);
}

std::vector<SnapshotInfo> SnapshotManager::list(const std::string& vm) {
    VirtualMachine handle(connector, vm);
    return list(handle);
}
