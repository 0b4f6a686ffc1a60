#include "Virtualization/snapshot/SnapshotDescriptor.hpp"
#include "Utils/Exception.hpp"
#include <pugixml.hpp>
#include <filesystem>
#include <fmt/format.h>

namespace SnapshotDescriptor {

namespace {

void load(pugi::xml_document& doc, std::string_view xml, const char* what) {
    const auto res = doc.load_buffer(xml.data(), xml.size());
    if (!res) {
        throw SnapshotOperationError(fmt::format("cannot parse {} XML: {}", what, res.description()));
    }
}

} // namespace

SnapshotInfo parse(std::string_view xml) {
    pugi::xml_document doc;
    load(doc, xml, "snapshot");
    const auto root = doc.child("domainsnapshot");
    if (!root) {
        throw SnapshotOperationError("snapshot XML has no <domainsnapshot> root");
    }

    SnapshotInfo info;
    info.name = root.child_value("name");
    info.description = root.child_value("description");
    info.state = root.child_value("state");
    info.creationTime = root.child("creationTime").text().as_llong(0);

    bool external = false;
    if (const auto memory = root.child("memory")) {
        const std::string mode = memory.attribute("snapshot").as_string("no");
        info.hasMemory = mode == "internal" || mode == "external";
        external = external || mode == "external";
    }

    for (const auto disk : root.child("disks").children("disk")) {
        if (std::string_view(disk.attribute("snapshot").as_string()) != "external") continue;
        external = true;
        if (const char* file = disk.child("source").attribute("file").as_string(nullptr)) {
            info.diskFiles.emplace_back(file);
        }
    }
    info.kind = external ? SnapshotKind::External : SnapshotKind::Internal;
    return info;
}

std::vector<DomainDisk> snapshotableDisks(std::string_view domainXml) {
    pugi::xml_document doc;
    load(doc, domainXml, "domain");
    std::vector<DomainDisk> disks;

    for (const auto disk : doc.child("domain").child("devices").children("disk")) {
        if (std::string_view(disk.attribute("type").as_string()) != "file") continue;
        if (std::string_view(disk.attribute("device").as_string()) != "disk") continue;

        const char* source = disk.child("source").attribute("file").as_string(nullptr);
        const char* target = disk.child("target").attribute("dev").as_string(nullptr);
        if (!source || !target) continue;

        DomainDisk d;
        d.target = target;
        d.sourceFile = source;
        if (const char* driver = disk.child("driver").attribute("type").as_string(nullptr); driver && *driver) {
            d.driverType = driver;
        }
        disks.push_back(std::move(d));
    }
    return disks;
}

std::string overlayPath(const DomainDisk& disk, std::string_view vmName, std::string_view snapshotName) {
    const auto dir = std::filesystem::path(disk.sourceFile).parent_path();
    return (dir / fmt::format("{}-{}-{}.qcow2", vmName, disk.target, snapshotName)).string();
}

std::string_view toString(SnapshotKind kind) noexcept {
    return kind == SnapshotKind::External ? "external" : "internal";
}

} // namespace SnapshotDescriptor
