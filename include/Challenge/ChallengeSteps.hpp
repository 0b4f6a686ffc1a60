#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Remote/ssh/SshTypes.hpp"

enum class SetupStepType { RunCommand, CopyFile };

struct SetupStep {
    SetupStepType type{SetupStepType::RunCommand};
    std::string description;

    // run_command
    std::string command;
    int expectedExitCode{0};

    // copy_file
    std::string localPath;
    std::string remotePath;
    bool createDirs{true};

    [[nodiscard]] std::string summary() const;
};

enum class ValidationStepType {
    RunCommand,
    ServiceStatus,
    PortListening,
    FileExists,
    FileContains,
    UserGroup,
    Process,
    Journal,
    History,
    AuditLog,
    LvmState
};

enum class UserCheck { UserExists, PrimaryGroup, InGroup, Shell };
enum class LvmCheck { PvExists, VgExists, LvExists, LvSize };

/**
 * @brief Match-count condition such as ">0", ">=2" or "==1" (a bare number means "==").
 */
struct CountExpectation {
    std::string op{">"};
    int value{0};

    [[nodiscard]] static std::optional<CountExpectation> parse(std::string_view text);
    [[nodiscard]] bool matches(int count) const noexcept;
    [[nodiscard]] std::string str() const;
};

[[nodiscard]] std::string_view toString(ValidationStepType type) noexcept;

struct StepOutcome {
    int index{0};
    std::string kind;
    std::string description;
    std::string command;
    bool passed{false};
    std::optional<int> exitCode;
    std::string stdoutText;
    std::string stderrText;
    std::string reason;
};

/**
 * @brief One validation check: a remote command plus the comparison of its result.
 */
struct ValidationStep {
    ValidationStepType type{ValidationStepType::RunCommand};
    std::string description;

    // run_command
    std::string command;
    int expectedExitCode{0};
    std::optional<std::string> stdoutEquals;
    std::optional<std::string> stdoutContains;
    std::optional<std::string> stdoutMatchesRegex;

    // check_service_status
    std::string service;
    std::string expectedStatus{"active"};
    bool checkEnabled{false};

    // check_port_listening
    int port{0};
    std::string protocol{"tcp"};

    // check_file_exists / check_file_contains
    std::string path;
    std::string fileType{"any"};
    std::string text;
    std::string regex;

    // check_user_group
    UserCheck userCheck{UserCheck::UserExists};
    std::string user;
    std::string group;
    std::string shell;

    // check_process
    std::string processName;
    std::string pidFile;

    // check_journalctl (service هو الوحدة) و check_audit_log
    std::string syslogIdentifier;
    std::string commandName;
    std::string messagePattern;
    std::string since;
    std::string ruleKey;

    // check_history
    std::string historyCommand{"cat ~/.bash_history 2>/dev/null || history 2>/dev/null"};
    std::string commandPattern;
    std::vector<std::string> disallowedCommands;
    std::optional<CountExpectation> expectedCount;

    // check_lvm_state
    LvmCheck lvmCheck{LvmCheck::PvExists};
    std::string device;
    std::string vgName;
    std::string lvName;
    std::optional<double> minSizeMb;
    std::optional<double> maxSizeMb;
    std::optional<double> exactSizeMb;

    // الحالة المتوقعة لفحوص الوجود (ملف، منفذ، محتوى)
    bool expectedState{true};

    [[nodiscard]] std::string buildCommand() const;
    // لا يُستدعى الا لنتيجة بدون خطأ اتصال
    [[nodiscard]] StepOutcome evaluate(const CommandResult& result) const;
};
