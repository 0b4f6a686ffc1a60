#include "Virtualization/snapshot/SnapshotXmlBuilder.hpp"
#include "Utils/Exception.hpp"
#include <pugixml.hpp>

void SnapshotXmlBuilder::buildDocument() {
  if (name.empty()) {
    throw SnapshotOperationError("snapshot name is required");
  }
  if (disks.empty()) {
    throw SnapshotOperationError("no suitable file-based disks for external snapshot of '" + domainName + "'");
  }

  auto root = doc.append_child("domainsnapshot");
  root.append_child("name").text() = name.c_str();
  if (!description.empty()) {
    root.append_child("description").text() = description.c_str();
  }
  buildDisksSection(root);
}

void SnapshotXmlBuilder::buildDisksSection(pugi::xml_node root) {
  auto section = root.append_child("disks");
  for (const auto& disk : disks) {
    auto node = section.append_child("disk");
    node.append_attribute("name") = disk.target.c_str();
    node.append_attribute("snapshot") = "external";

    // ملف overlay يكون qcow2 دائما مهما كان نوع القرص الأساسي
    node.append_child("driver").append_attribute("type") = "qcow2";

    const auto overlay = SnapshotDescriptor::overlayPath(disk, domainName, name);
    node.append_child("source").append_attribute("file") = overlay.c_str();
  }
}

SnapshotXmlBuilder& SnapshotXmlBuilder::setName(std::string_view n) {
  name = n;
  return *this;
}

SnapshotXmlBuilder& SnapshotXmlBuilder::setDomainName(std::string_view domain) {
  domainName = domain;
  return *this;
}

SnapshotXmlBuilder& SnapshotXmlBuilder::setDescription(std::string_view desc) {
  description = desc;
  return *this;
}

SnapshotXmlBuilder& SnapshotXmlBuilder::addDisk(const DomainDisk& disk) {
  disks.push_back(disk);
  return *this;
}

SnapshotXmlBuilder& SnapshotXmlBuilder::addDisks(const std::vector<DomainDisk>& list) {
  disks.insert(disks.end(), list.begin(), list.end());
  return *this;
}

std::vector<std::string> SnapshotXmlBuilder::plannedFiles() const {
  std::vector<std::string> files;
  files.reserve(disks.size());
  for (const auto& disk : disks) {
    files.push_back(SnapshotDescriptor::overlayPath(disk, domainName, name));
  }
  return files;
}
