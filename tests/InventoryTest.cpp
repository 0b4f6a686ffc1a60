#include <gtest/gtest.h>
#include "Virtualization/vmm/VirtualMachineInventory.hpp"

namespace {

VmSummary vm(std::string name, VmStatus status, std::string ip = "unknown") {
    return VmSummary{std::move(name), status, std::move(ip)};
}

} // namespace

TEST(InventoryTest, MergeIsSortedAndDeduplicated) {
    const auto merged = VirtualMachineInventory::merge(
        {vm("web", VmStatus::Running, "192.168.122.10"), vm("alpha", VmStatus::Running)},
        {vm("zeta", VmStatus::Stopped), vm("beta", VmStatus::Stopped)});

    ASSERT_EQ(merged.size(), 4u);
    EXPECT_EQ(merged[0].name, "alpha");
    EXPECT_EQ(merged[1].name, "beta");
    EXPECT_EQ(merged[2].name, "web");
    EXPECT_EQ(merged[2].ip, "192.168.122.10");
    EXPECT_EQ(merged[3].name, "zeta");
}

TEST(InventoryTest, RunningEntryWinsOverDefinedDuplicate) {
    const auto merged = VirtualMachineInventory::merge(
        {vm("demo", VmStatus::Running, "10.0.0.2")},
        {vm("demo", VmStatus::Stopped)});

    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].status, VmStatus::Running);
    EXPECT_EQ(merged[0].ip, "10.0.0.2");
}

TEST(InventoryTest, StoppedVmsHaveUnknownAddress) {
    const auto merged = VirtualMachineInventory::merge({}, {vm("demo", VmStatus::Stopped)});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].ip, "unknown");
}
