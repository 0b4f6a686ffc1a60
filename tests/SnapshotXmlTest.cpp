#include <gtest/gtest.h>
#include "Utils/Exception.hpp"
#include "Virtualization/snapshot/SnapshotDescriptor.hpp"
#include "Virtualization/snapshot/SnapshotXmlBuilder.hpp"
#include <pugixml.hpp>

namespace {

constexpr const char* kDomainXml = R"(
<domain type='kvm'>
  <name>demo</name>
  <devices>
    <disk type='file' device='disk'>
      <driver name='qemu' type='qcow2'/>
      <source file='/var/lib/libvirt/images/demo.qcow2'/>
      <target dev='vda' bus='virtio'/>
    </disk>
    <disk type='file' device='disk'>
      <driver name='qemu' type='raw'/>
      <source file='/data/demo-data.img'/>
      <target dev='vdb' bus='virtio'/>
    </disk>
    <disk type='file' device='cdrom'>
      <source file='/iso/ubuntu.iso'/>
      <target dev='sda' bus='sata'/>
    </disk>
    <disk type='block' device='disk'>
      <source dev='/dev/sdz'/>
      <target dev='vdc' bus='virtio'/>
    </disk>
  </devices>
</domain>)";

} // namespace

TEST(SnapshotDescriptorTest, OnlyFileBackedDisksAreSnapshotable) {
    const auto disks = SnapshotDescriptor::snapshotableDisks(kDomainXml);
    ASSERT_EQ(disks.size(), 2u);
    EXPECT_EQ(disks[0].target, "vda");
    EXPECT_EQ(disks[0].sourceFile, "/var/lib/libvirt/images/demo.qcow2");
    EXPECT_EQ(disks[0].driverType, "qcow2");
    EXPECT_EQ(disks[1].target, "vdb");
    EXPECT_EQ(disks[1].driverType, "raw");
}

TEST(SnapshotDescriptorTest, OverlaySitsNextToTheBaseImage) {
    const DomainDisk disk{"vda", "/var/lib/libvirt/images/demo.qcow2", "qcow2"};
    EXPECT_EQ(SnapshotDescriptor::overlayPath(disk, "demo", "s1"), "/var/lib/libvirt/images/demo-vda-s1.qcow2");
}

TEST(SnapshotXmlBuilderTest, BuildsDiskOnlyExternalSnapshot) {
    SnapshotXmlBuilder builder;
    builder.setName("practice-set_hostname-1a2b3c4d")
        .setDomainName("demo")
        .setDescription("before challenge")
        .addDisks(SnapshotDescriptor::snapshotableDisks(kDomainXml));

    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(builder.build().c_str()));
    const auto root = doc.child("domainsnapshot");
    EXPECT_STREQ(root.child_value("name"), "practice-set_hostname-1a2b3c4d");
    EXPECT_STREQ(root.child_value("description"), "before challenge");

    std::vector<pugi::xml_node> disks;
    for (auto d : root.child("disks").children("disk")) disks.push_back(d);
    ASSERT_EQ(disks.size(), 2u);
    EXPECT_STREQ(disks[0].attribute("name").as_string(), "vda");
    EXPECT_STREQ(disks[0].attribute("snapshot").as_string(), "external");
    EXPECT_STREQ(disks[0].child("driver").attribute("type").as_string(), "qcow2");
    EXPECT_STREQ(disks[0].child("source").attribute("file").as_string(),
                 "/var/lib/libvirt/images/demo-vda-practice-set_hostname-1a2b3c4d.qcow2");
    // overlay فوق قرص raw يبقى qcow2
    EXPECT_STREQ(disks[1].child("driver").attribute("type").as_string(), "qcow2");

    EXPECT_EQ(builder.plannedFiles(), (std::vector<std::string>{
        "/var/lib/libvirt/images/demo-vda-practice-set_hostname-1a2b3c4d.qcow2",
        "/data/demo-vdb-practice-set_hostname-1a2b3c4d.qcow2"}));
}

TEST(SnapshotXmlBuilderTest, RequiresNameAndDisks) {
    SnapshotXmlBuilder noDisks;
    noDisks.setName("s1").setDomainName("demo");
    EXPECT_THROW((void)noDisks.build(), SnapshotOperationError);

    SnapshotXmlBuilder noName;
    noName.setDomainName("demo").addDisk(DomainDisk{"vda", "/img/demo.qcow2", "qcow2"});
    EXPECT_THROW((void)noName.build(), SnapshotOperationError);
}

TEST(SnapshotDescriptorTest, ParsesExternalSnapshot) {
    const auto info = SnapshotDescriptor::parse(R"(
<domainsnapshot>
  <name>s1</name>
  <description>pre-challenge</description>
  <state>running</state>
  <creationTime>1700000000</creationTime>
  <memory snapshot='no'/>
  <disks>
    <disk name='vda' snapshot='external' type='file'>
      <driver type='qcow2'/>
      <source file='/img/demo-vda-s1.qcow2'/>
    </disk>
    <disk name='sda' snapshot='no'/>
  </disks>
</domainsnapshot>)");

    EXPECT_EQ(info.name, "s1");
    EXPECT_EQ(info.description, "pre-challenge");
    EXPECT_EQ(info.state, "running");
    EXPECT_EQ(info.creationTime, 1700000000);
    EXPECT_TRUE(info.isExternal());
    EXPECT_FALSE(info.hasMemory);
    EXPECT_EQ(info.diskFiles, std::vector<std::string>{"/img/demo-vda-s1.qcow2"});
}

TEST(SnapshotDescriptorTest, InternalSnapshotWithMemory) {
    const auto info = SnapshotDescriptor::parse(
        "<domainsnapshot><name>s2</name><memory snapshot='internal'/>"
        "<disks><disk name='vda' snapshot='internal'/></disks></domainsnapshot>");
    EXPECT_FALSE(info.isExternal());
    EXPECT_TRUE(info.hasMemory);
    EXPECT_TRUE(info.diskFiles.empty());
}

TEST(SnapshotDescriptorTest, MalformedXmlIsASnapshotError) {
    EXPECT_THROW((void)SnapshotDescriptor::parse("<domainsnapshot><name>"), SnapshotOperationError);
    EXPECT_THROW((void)SnapshotDescriptor::parse("<domain/>"), SnapshotOperationError);
}
