#include <gtest/gtest.h>
#include "Core/config/LabConfig.hpp"
#include "Utils/Exception.hpp"

TEST(LabConfigTest, EmptyDocumentGivesDefaults) {
    const auto cfg = LabConfig::fromYAML("");
    EXPECT_EQ(cfg.hypervisor.uri, "qemu:///system");
    EXPECT_EQ(cfg.hypervisor.defaultVm, "ubuntu22.04-1");
    EXPECT_EQ(cfg.ssh.user, "roo");
    EXPECT_EQ(cfg.ssh.port, 22);
    EXPECT_EQ(cfg.readiness.timeout, std::chrono::seconds(120));
    EXPECT_EQ(cfg.readiness.pollInterval, std::chrono::seconds(5));
    EXPECT_TRUE(cfg.snapshot.freezeFs);
    EXPECT_EQ(cfg.snapshot.prefix, "practice");
}

TEST(LabConfigTest, ReadsAllSections) {
    const auto cfg = LabConfig::fromYAML(R"(
hypervisor:
  uri: test:///default
  default_vm: demo
  shutdown_timeout: 30
ssh:
  user: student
  key: /tmp/key
  port: 2222
  command_timeout: 60
readiness:
  timeout: 90
  poll_interval: 3
snapshot:
  freeze_fs: false
  prefix: lab
challenges:
  directory: /srv/challenges
logging:
  level: debug
  file: /tmp/practicelab.log
)");
    EXPECT_EQ(cfg.hypervisor.uri, "test:///default");
    EXPECT_EQ(cfg.hypervisor.defaultVm, "demo");
    EXPECT_EQ(cfg.hypervisor.shutdownTimeout, std::chrono::seconds(30));
    EXPECT_EQ(cfg.ssh.user, "student");
    EXPECT_EQ(cfg.ssh.keyPath, "/tmp/key");
    EXPECT_EQ(cfg.ssh.port, 2222);
    EXPECT_EQ(cfg.ssh.commandTimeout, std::chrono::seconds(60));
    EXPECT_EQ(cfg.readiness.pollInterval, std::chrono::seconds(3));
    EXPECT_FALSE(cfg.snapshot.freezeFs);
    EXPECT_EQ(cfg.snapshot.prefix, "lab");
    EXPECT_EQ(cfg.challengesDirectory, "/srv/challenges");
    EXPECT_EQ(cfg.logging.console_level, BoostLogger::Level::Debug);
    EXPECT_EQ(cfg.logging.file_path, "/tmp/practicelab.log");
}

TEST(LabConfigTest, InvalidValueNamesTheKey) {
    try {
        (void)LabConfig::fromYAML("ssh:\n  port: 70000\n");
        FAIL() << "expected InvalidDefinitionError";
    } catch (const InvalidDefinitionError& e) {
        EXPECT_EQ(e.field(), "ssh.port");
    }
}

TEST(LabConfigTest, WrongTypeNamesTheKey) {
    try {
        (void)LabConfig::fromYAML("readiness:\n  timeout: soon\n");
        FAIL() << "expected InvalidDefinitionError";
    } catch (const InvalidDefinitionError& e) {
        EXPECT_EQ(e.field(), "readiness.timeout");
    }
}

TEST(LabConfigTest, PollIntervalLongerThanTimeoutIsRejected) {
    EXPECT_THROW((void)LabConfig::fromYAML("readiness:\n  timeout: 5\n  poll_interval: 10\n"), InvalidDefinitionError);
}
