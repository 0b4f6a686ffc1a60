#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <libvirt/libvirt.h>
#include "Virtualization/snapshot/SnapshotManager.hpp"
#include "Virtualization/vmm/HypervisorSession.hpp"
#include "Utils/Exception.hpp"

// test:///default هو سائق libvirt داخل العملية، فيه جهاز واحد اسمه "test" يعمل
namespace {

constexpr auto kUri = "test:///default";
constexpr auto kVm = "test";

class LibvirtTestDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        session = HypervisorSession::connect(kUri, std::chrono::seconds(2));
        session->ensureRunning(kVm);
    }

    void TearDown() override {
        for (const auto& snap : session->snapshotManager().list(kVm)) {
            session->snapshotManager().remove(kVm, snap.name);
        }
        session->ensureRunning(kVm);
    }

    void createInternalSnapshot(const std::string& name) {
        auto vm = session->findVM(kVm);
        const auto xml = "<domainsnapshot><name>" + name + "</name></domainsnapshot>";
        virDomainSnapshotPtr snap = virDomainSnapshotCreateXML(vm.getRawHandle(), xml.c_str(), 0);
        ASSERT_NE(snap, nullptr);
        virDomainSnapshotFree(snap);
    }

    std::unique_ptr<HypervisorSession> session;
};

} // namespace

TEST_F(LibvirtTestDriverTest, ListsTheDefaultDomain) {
    const auto vms = session->listVMs();
    const auto it = std::find_if(vms.begin(), vms.end(), [](const VmSummary& s) { return s.name == kVm; });
    ASSERT_NE(it, vms.end());
    EXPECT_EQ(it->status, VmStatus::Running);
}

TEST_F(LibvirtTestDriverTest, UnknownVmIsNotFound) {
    EXPECT_THROW((void)session->findVM("nope"), NotFoundError);
    EXPECT_THROW((void)session->runState("nope"), NotFoundError);
}

TEST_F(LibvirtTestDriverTest, EnsureRunningIsIdempotent) {
    EXPECT_TRUE(session->ensureRunning(kVm));
    EXPECT_TRUE(session->ensureRunning(kVm));
    EXPECT_EQ(session->runState(kVm), RunState::Running);
}

TEST_F(LibvirtTestDriverTest, EnsureRunningResumesAPausedDomain) {
    {
        auto vm = session->findVM(kVm);
        ASSERT_EQ(virDomainSuspend(vm.getRawHandle()), 0);
        EXPECT_TRUE(vm.isPaused());
    }

    EXPECT_TRUE(session->ensureRunning(kVm));

    auto vm = session->findVM(kVm);
    int state = VIR_DOMAIN_NOSTATE;
    ASSERT_EQ(virDomainGetState(vm.getRawHandle(), &state, nullptr, 0), 0);
    EXPECT_EQ(state, VIR_DOMAIN_RUNNING);
    EXPECT_FALSE(vm.isPaused());
}

TEST_F(LibvirtTestDriverTest, PowerOffThenStart) {
    session->powerOff(kVm, std::chrono::seconds(2));
    EXPECT_EQ(session->runState(kVm), RunState::Shutoff);

    session->ensureRunning(kVm);
    EXPECT_EQ(session->runState(kVm), RunState::Running);
}

TEST_F(LibvirtTestDriverTest, RevertingMissingSnapshotIsNotFound) {
    EXPECT_THROW(session->snapshotManager().revert(kVm, "does-not-exist"), NotFoundError);
    EXPECT_THROW(session->snapshotManager().remove(kVm, "does-not-exist"), NotFoundError);
}

TEST_F(LibvirtTestDriverTest, RevertRestoresRunningStateAndDeleteClearsMetadata) {
    createInternalSnapshot("s1");
    auto& snapshots = session->snapshotManager();

    auto listed = snapshots.list(kVm);
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].name, "s1");
    EXPECT_EQ(listed[0].kind, SnapshotKind::Internal);

    snapshots.revert(kVm, "s1");
    EXPECT_EQ(session->runState(kVm), RunState::Running);
    EXPECT_EQ(snapshots.tracker().get(kVm, "s1"), SnapshotState::Present);

    const auto outcome = snapshots.remove(kVm, "s1");
    EXPECT_TRUE(outcome.metadataRemoved);
    EXPECT_TRUE(outcome.retainedFiles.empty());
    EXPECT_TRUE(snapshots.list(kVm).empty());
}

TEST_F(LibvirtTestDriverTest, CreatingAnExistingSnapshotNameIsRefused) {
    createInternalSnapshot("dup");
    auto& snapshots = session->snapshotManager();

    EXPECT_THROW((void)snapshots.createExternal(kVm, "dup", "second copy", false), SnapshotOperationError);
    EXPECT_EQ(snapshots.tracker().get(kVm, "dup"), SnapshotState::None);

    const auto listed = snapshots.list(kVm);
    EXPECT_EQ(std::count_if(listed.begin(), listed.end(), [](const SnapshotInfo& s) { return s.name == "dup"; }), 1);
}

TEST_F(LibvirtTestDriverTest, ListReportsEachSnapshotOnce) {
    createInternalSnapshot("first");
    createInternalSnapshot("second");

    const auto listed = session->snapshotManager().list(kVm);
    ASSERT_EQ(listed.size(), 2u);
    for (const char* name : {"first", "second"}) {
        EXPECT_EQ(std::count_if(listed.begin(), listed.end(), [name](const SnapshotInfo& s) { return s.name == name; }), 1)
            << name;
    }
}

TEST(SnapshotBackingFilesTest, MissingOverlayIsASnapshotError) {
    const auto present = std::filesystem::temp_directory_path() / "practicelab-overlay.qcow2";
    std::ofstream(present) << "qcow";

    EXPECT_NO_THROW(SnapshotManager::verifyBackingFiles("demo", "s1", {present.string()}));
    try {
        SnapshotManager::verifyBackingFiles("demo", "s1", {present.string(), "/nonexistent/demo-vda-s1.qcow2"});
        FAIL() << "expected SnapshotOperationError";
    } catch (const SnapshotOperationError& e) {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/demo-vda-s1.qcow2"), std::string::npos);
        EXPECT_EQ(std::string(e.what()).find(present.string()), std::string::npos);
    }
    EXPECT_EQ(SnapshotManager::missingFiles({"/nonexistent/a.qcow2", present.string()}),
              std::vector<std::string>{"/nonexistent/a.qcow2"});
    std::filesystem::remove(present);
}

TEST_F(LibvirtTestDriverTest, CloseIsIdempotent) {
    session->close();
    EXPECT_FALSE(session->isOpen());
    session->close();
    EXPECT_FALSE(session->isOpen());
    session = HypervisorSession::connect(kUri, std::chrono::seconds(2));
}

TEST(LibvirtConnectTest, UnknownDriverRaisesConnectionError) {
    EXPECT_THROW((void)HypervisorSession::connect("nosuchdriver:///system", std::chrono::seconds(1)),
                 ConnectionError);
}
