#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class SnapshotKind { External, Internal };

struct SnapshotInfo {
    std::string name;
    std::int64_t creationTime{0};  // ثواني منذ epoch
    std::string state;             // حالة الضيف لحظة الالتقاط
    std::string description;
    SnapshotKind kind{SnapshotKind::Internal};
    bool hasMemory{false};
    std::vector<std::string> diskFiles;

    [[nodiscard]] bool isExternal() const noexcept { return kind == SnapshotKind::External; }
};

struct SnapshotDeleteOutcome {
    bool metadataRemoved{false};
    std::vector<std::string> retainedFiles;
    std::string message;
};

// قرص قابل للالتقاط من وصف النطاق
struct DomainDisk {
    std::string target;      // vda, sda ...
    std::string sourceFile;
    std::string driverType{"qcow2"};
};

namespace SnapshotDescriptor {

// يحلل ناتج virDomainSnapshotGetXMLDesc
[[nodiscard]] SnapshotInfo parse(std::string_view xml);

// أقراص type='file' device='disk' فقط
[[nodiscard]] std::vector<DomainDisk> snapshotableDisks(std::string_view domainXml);

// {vm}-{target}-{snapshot}.qcow2 بجوار القرص الأساسي
[[nodiscard]] std::string overlayPath(const DomainDisk& disk, std::string_view vmName, std::string_view snapshotName);

[[nodiscard]] std::string_view toString(SnapshotKind kind) noexcept;

} // namespace SnapshotDescriptor
