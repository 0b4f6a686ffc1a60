#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include "Virtualization/snapshot/SnapshotDescriptor.hpp"
#include <string_view>
#include <vector>

/**
 * @brief Builder for disk-only external <domainsnapshot> documents
 *
 * Every added disk gets an overlay file next to its base image, named
 * after the domain, the disk target and the snapshot.
 */
class SnapshotXmlBuilder : public IXmlBuilderBase {
private:
  std::string name;
  std::string domainName;
  std::string description;
  std::vector<DomainDisk> disks;

  void buildDocument() override;
  void buildDisksSection(pugi::xml_node root);

public:
  SnapshotXmlBuilder() = default;
  ~SnapshotXmlBuilder() override = default;

  SnapshotXmlBuilder& setName(std::string_view name);
  SnapshotXmlBuilder& setDomainName(std::string_view domain);
  SnapshotXmlBuilder& setDescription(std::string_view description);
  SnapshotXmlBuilder& addDisk(const DomainDisk& disk);
  SnapshotXmlBuilder& addDisks(const std::vector<DomainDisk>& disks);

  // مسارات ملفات overlay المتوقعة بعد الإنشاء
  [[nodiscard]] std::vector<std::string> plannedFiles() const;

  void reset() noexcept {
    IXmlBuilderBase::reset();
    name.clear();
    domainName.clear();
    description.clear();
    disks.clear();
  }
};
