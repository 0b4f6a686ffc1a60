#include <gtest/gtest.h>
#include "Challenge/ChallengeSteps.hpp"

namespace {

CommandResult exited(int code, std::string out = "", std::string err = "") {
    return CommandResult::fromExit(code, std::move(out), std::move(err));
}

ValidationStep runCommand(std::string command) {
    ValidationStep step;
    step.type = ValidationStepType::RunCommand;
    step.command = std::move(command);
    return step;
}

} // namespace

TEST(ValidationStepTest, RunCommandComparesTrimmedStdout) {
    auto step = runCommand("hostname");
    step.stdoutEquals = "practice-server";

    EXPECT_TRUE(step.evaluate(exited(0, "practice-server\n")).passed);

    const auto failed = step.evaluate(exited(0, "lab-default\n"));
    EXPECT_FALSE(failed.passed);
    EXPECT_EQ(failed.command, "hostname");
    EXPECT_EQ(failed.reason, "stdout 'lab-default' (expected 'practice-server')");
}

TEST(ValidationStepTest, RunCommandChecksExitCodeFirst) {
    auto step = runCommand("false");
    const auto out = step.evaluate(exited(1, "", "boom\n"));
    EXPECT_FALSE(out.passed);
    EXPECT_EQ(out.reason, "exit code 1 (expected 0): boom");

    step.expectedExitCode = 1;
    EXPECT_TRUE(step.evaluate(exited(1)).passed);
}

TEST(ValidationStepTest, RunCommandContainsAndRegex) {
    auto step = runCommand("cat /etc/os-release");
    step.stdoutContains = "Ubuntu";
    step.stdoutMatchesRegex = "VERSION_ID=\"2[24]\\.04\"";

    EXPECT_TRUE(step.evaluate(exited(0, "NAME=\"Ubuntu\"\nVERSION_ID=\"22.04\"\n")).passed);
    EXPECT_FALSE(step.evaluate(exited(0, "NAME=\"Debian\"\nVERSION_ID=\"22.04\"\n")).passed);
    EXPECT_FALSE(step.evaluate(exited(0, "NAME=\"Ubuntu\"\nVERSION_ID=\"20.04\"\n")).passed);
}

TEST(ValidationStepTest, ServiceStatus) {
    ValidationStep step;
    step.type = ValidationStepType::ServiceStatus;
    step.service = "nginx";
    step.checkEnabled = true;

    EXPECT_EQ(step.buildCommand(), "systemctl is-active 'nginx'; systemctl is-enabled 'nginx'");
    EXPECT_TRUE(step.evaluate(exited(0, "active\nenabled\n")).passed);

    const auto disabled = step.evaluate(exited(1, "active\ndisabled\n"));
    EXPECT_FALSE(disabled.passed);
    EXPECT_EQ(disabled.reason, "service 'nginx' is not enabled ('disabled')");

    EXPECT_FALSE(step.evaluate(exited(3, "inactive\nenabled\n")).passed);
}

TEST(ValidationStepTest, PortListeningHonoursExpectedState) {
    ValidationStep step;
    step.type = ValidationStepType::PortListening;
    step.port = 80;

    EXPECT_EQ(step.buildCommand(), "ss -tlnp | grep ':80 ' || netstat -tlnp | grep ':80 '");
    EXPECT_TRUE(step.evaluate(exited(0, "LISTEN 0 511 0.0.0.0:80 ")).passed);
    EXPECT_FALSE(step.evaluate(exited(1)).passed);

    step.expectedState = false;
    EXPECT_TRUE(step.evaluate(exited(1)).passed);
}

TEST(ValidationStepTest, FileChecks) {
    ValidationStep exists;
    exists.type = ValidationStepType::FileExists;
    exists.path = "/home/devuser";
    exists.fileType = "directory";
    EXPECT_EQ(exists.buildCommand(), "test -d '/home/devuser'");
    EXPECT_TRUE(exists.evaluate(exited(0)).passed);

    ValidationStep contains;
    contains.type = ValidationStepType::FileContains;
    contains.path = "/etc/hostname";
    contains.text = "practice-server";
    EXPECT_EQ(contains.buildCommand(), "grep -q -F -- 'practice-server' '/etc/hostname'");
    const auto missing = contains.evaluate(exited(1));
    EXPECT_FALSE(missing.passed);
    EXPECT_EQ(missing.reason, "'practice-server' not found in '/etc/hostname' (expected found)");

    contains.regex = "practice +lab";
    EXPECT_EQ(contains.buildCommand(), "grep -q -E -- 'practice +lab' '/etc/hostname'");
}

TEST(ValidationStepTest, FileContainsDistinguishesGrepErrors) {
    ValidationStep absent;
    absent.type = ValidationStepType::FileContains;
    absent.path = "/etc/ssh/sshd_config";
    absent.text = "PermitRootLogin yes";
    absent.expectedState = false;

    EXPECT_TRUE(absent.evaluate(exited(1)).passed);
    EXPECT_FALSE(absent.evaluate(exited(0)).passed);

    const auto unreadable = absent.evaluate(exited(2, "", "grep: /etc/ssh/sshd_config: No such file or directory\n"));
    EXPECT_FALSE(unreadable.passed);
    EXPECT_EQ(unreadable.reason, "grep on '/etc/ssh/sshd_config' failed with exit code 2: "
                                 "grep: /etc/ssh/sshd_config: No such file or directory");
}

TEST(ValidationStepTest, FileContainsPatternStartingWithDash) {
    ValidationStep step;
    step.type = ValidationStepType::FileContains;
    step.path = "/etc/ssh/sshd_config";
    step.text = "-o StrictModes";
    EXPECT_EQ(step.buildCommand(), "grep -q -F -- '-o StrictModes' '/etc/ssh/sshd_config'");
}

TEST(ValidationStepTest, ProcessCheck) {
    ValidationStep step;
    step.type = ValidationStepType::Process;
    step.processName = "nginx";
    EXPECT_EQ(step.buildCommand(), "pgrep -x -- 'nginx'");
    EXPECT_TRUE(step.evaluate(exited(0, "812\n")).passed);
    EXPECT_EQ(step.evaluate(exited(1)).reason, "process 'nginx' is not running (expected running)");
    EXPECT_FALSE(step.evaluate(exited(3, "", "pgrep: bad option")).passed);

    step.expectedState = false;
    EXPECT_TRUE(step.evaluate(exited(1)).passed);
}

TEST(ValidationStepTest, ProcessCheckWithPidFile) {
    ValidationStep step;
    step.type = ValidationStepType::Process;
    step.processName = "nginx";
    step.pidFile = "/run/nginx.pid";
    EXPECT_NE(step.buildCommand().find("test -f '/run/nginx.pid'"), std::string::npos);

    EXPECT_TRUE(step.evaluate(exited(0, "pid-file: present\n")).passed);
    const auto stale = step.evaluate(exited(0, "pid-file: absent\n"));
    EXPECT_FALSE(stale.passed);
    EXPECT_EQ(stale.reason, "pid file '/run/nginx.pid' is absent (expected present)");
}

TEST(ValidationStepTest, JournalCheck) {
    ValidationStep step;
    step.type = ValidationStepType::Journal;
    step.service = "sshd";
    step.since = "10 minutes ago";
    step.messagePattern = "Accepted publickey";
    EXPECT_EQ(step.buildCommand(),
              "journalctl --no-pager --quiet --since '10 minutes ago' -u 'sshd' | grep -q -E -- 'Accepted publickey'");
    EXPECT_TRUE(step.evaluate(exited(0)).passed);
    EXPECT_FALSE(step.evaluate(exited(1)).passed);
    EXPECT_FALSE(step.evaluate(exited(2, "", "grep: invalid")).passed);

    step.messagePattern.clear();
    step.syslogIdentifier = "sudo";
    EXPECT_EQ(step.buildCommand(),
              "journalctl --no-pager --quiet --since '10 minutes ago' -u 'sshd' 'SYSLOG_IDENTIFIER=sudo' | grep -q .");
}

TEST(ValidationStepTest, HistoryCheck) {
    ValidationStep step;
    step.type = ValidationStepType::History;
    step.commandPattern = "^sudo useradd";
    const std::string history = "ls\nsudo useradd devuser\nsudo useradd -m tester\nrm -rf /tmp/x\n";

    EXPECT_TRUE(step.evaluate(exited(0, history)).passed);
    EXPECT_FALSE(step.evaluate(exited(0, "ls\n")).passed);

    step.expectedCount = CountExpectation::parse("==1");
    const auto twice = step.evaluate(exited(0, history));
    EXPECT_FALSE(twice.passed);
    EXPECT_EQ(twice.reason, "pattern /^sudo useradd/ matched 2 time(s) (expected ==1)");

    step.expectedCount = CountExpectation::parse(">=2");
    step.disallowedCommands = {"rm -rf"};
    const auto banned = step.evaluate(exited(0, history));
    EXPECT_FALSE(banned.passed);
    EXPECT_EQ(banned.reason, "disallowed pattern /rm -rf/ found in history");
}

TEST(ValidationStepTest, CountExpectationParsing) {
    EXPECT_EQ(CountExpectation::parse("3")->str(), "==3");
    EXPECT_EQ(CountExpectation::parse(" > 0 ")->str(), ">0");
    EXPECT_TRUE(CountExpectation::parse("<5")->matches(4));
    EXPECT_FALSE(CountExpectation::parse("!=2")->matches(2));
    EXPECT_FALSE(CountExpectation::parse("=>1").has_value());
    EXPECT_FALSE(CountExpectation::parse("many").has_value());
    EXPECT_FALSE(CountExpectation::parse(">").has_value());
}

TEST(ValidationStepTest, AuditLogCheck) {
    ValidationStep step;
    step.type = ValidationStepType::AuditLog;
    step.ruleKey = "passwd_changes";
    step.since = "recent";
    EXPECT_EQ(step.buildCommand(), "ausearch --input-logs -k 'passwd_changes' --start 'recent'");

    EXPECT_TRUE(step.evaluate(exited(0, "type=SYSCALL msg=audit(1)")).passed);
    const auto none = step.evaluate(exited(1, "", "<no matches>\n"));
    EXPECT_FALSE(none.passed);
    EXPECT_EQ(none.reason, "audit entries for key 'passwd_changes' not found (expected found)");

    step.expectedState = false;
    EXPECT_TRUE(step.evaluate(exited(1, "", "<no matches>\n")).passed);
    EXPECT_FALSE(step.evaluate(exited(1, "", "Error opening config file")).passed);

    step.since = "10/19/2026 09:00:00";
    EXPECT_EQ(step.buildCommand(), "ausearch --input-logs -k 'passwd_changes' --start '10/19/2026' '09:00:00'");
}

TEST(ValidationStepTest, LvmExistenceChecks) {
    ValidationStep step;
    step.type = ValidationStepType::LvmState;
    step.lvmCheck = LvmCheck::LvExists;
    step.vgName = "vg_data";
    step.lvName = "lv_home";
    EXPECT_EQ(step.buildCommand(), "lvs --noheadings -o lv_name 'vg_data/lv_home'");
    EXPECT_TRUE(step.evaluate(exited(0, "  lv_home\n")).passed);
    EXPECT_EQ(step.evaluate(exited(5, "", "Failed to find logical volume")).reason,
              "logical volume 'vg_data/lv_home' is absent (expected present)");

    step.lvmCheck = LvmCheck::PvExists;
    step.device = "/dev/vdb";
    EXPECT_EQ(step.buildCommand(), "pvs --noheadings -o pv_name '/dev/vdb'");
}

TEST(ValidationStepTest, LvmSizeCheck) {
    ValidationStep step;
    step.type = ValidationStepType::LvmState;
    step.lvmCheck = LvmCheck::LvSize;
    step.vgName = "vg_data";
    step.lvName = "lv_home";
    step.minSizeMb = 500;
    EXPECT_EQ(step.buildCommand(), "lvs --noheadings --units m -o lv_size 'vg_data/lv_home'");

    EXPECT_TRUE(step.evaluate(exited(0, "  512.00m\n")).passed);
    EXPECT_TRUE(step.evaluate(exited(0, "  <600.00m\n")).passed);
    EXPECT_EQ(step.evaluate(exited(0, "  256.00m\n")).reason, "size 256.00MB is below 500MB");
    EXPECT_FALSE(step.evaluate(exited(0, "unknown")).passed);
    EXPECT_FALSE(step.evaluate(exited(5, "", "not found")).passed);

    step.minSizeMb.reset();
    step.exactSizeMb = 512;
    EXPECT_TRUE(step.evaluate(exited(0, "512.04m")).passed);
    EXPECT_FALSE(step.evaluate(exited(0, "520.00m")).passed);
}

TEST(ValidationStepTest, UserGroupChecks) {
    ValidationStep step;
    step.type = ValidationStepType::UserGroup;
    step.user = "devuser";

    step.userCheck = UserCheck::UserExists;
    EXPECT_EQ(step.buildCommand(), "id 'devuser'");
    EXPECT_FALSE(step.evaluate(exited(1, "", "id: 'devuser': no such user")).passed);

    step.userCheck = UserCheck::InGroup;
    step.group = "developers";
    EXPECT_EQ(step.buildCommand(), "id -nG 'devuser'");
    EXPECT_TRUE(step.evaluate(exited(0, "devuser developers sudo\n")).passed);
    EXPECT_FALSE(step.evaluate(exited(0, "devuser sudo\n")).passed);

    step.userCheck = UserCheck::Shell;
    step.shell = "/bin/bash";
    EXPECT_EQ(step.buildCommand(), "getent passwd 'devuser' | cut -d: -f7");
    EXPECT_TRUE(step.evaluate(exited(0, "/bin/bash\n")).passed);
    EXPECT_FALSE(step.evaluate(exited(0, "/bin/sh\n")).passed);
}

TEST(SetupStepTest, SummaryPrefersDescription) {
    SetupStep step;
    step.command = "sudo apt-get update";
    EXPECT_EQ(step.summary(), "sudo apt-get update");
    step.description = "refresh package lists";
    EXPECT_EQ(step.summary(), "refresh package lists");

    SetupStep copy;
    copy.type = SetupStepType::CopyFile;
    copy.localPath = "files/motd";
    copy.remotePath = "/etc/motd";
    EXPECT_EQ(copy.summary(), "copy files/motd -> /etc/motd");
}
