#include "Challenge/ChallengeLoader.hpp"
#include "Utils/Exception.hpp"
#include "Utils/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <array>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <fmt/format.h>

namespace {

constexpr std::array<std::string_view, 16> kAllowedKeys{
    "id", "name", "description", "category", "difficulty", "score", "concepts",
    "steps", "setup", "user_action_simulation", "validation", "hints", "flag",
    "simulate", "keep_snapshot", "version"};

std::string field(std::string_view parent, std::string_view key) {
    return parent.empty() ? std::string(key) : fmt::format("{}.{}", parent, key);
}

template <typename T>
T scalar(const YAML::Node& node, const std::string& name) {
    if (!node.IsScalar()) {
        throw InvalidDefinitionError(name, "must be a scalar value");
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw InvalidDefinitionError(name, e.what());
    }
}

std::string requireString(const YAML::Node& map, std::string_view key, std::string_view parent) {
    const auto name = field(parent, key);
    const auto node = map[std::string(key)];
    if (!node || node.IsNull()) {
        throw InvalidDefinitionError(name, "missing required key");
    }
    auto value = scalar<std::string>(node, name);
    if (value.empty()) {
        throw InvalidDefinitionError(name, "must not be empty");
    }
    return value;
}

template <typename T>
void readOptional(const YAML::Node& map, std::string_view key, std::string_view parent, T& target) {
    const auto node = map[std::string(key)];
    if (!node || node.IsNull()) return;
    target = scalar<T>(node, field(parent, key));
}

void checkRegex(const std::string& pattern, const std::string& name) {
    try {
        std::regex compiled(pattern);
    } catch (const std::regex_error& e) {
        throw InvalidDefinitionError(name, e.what());
    }
}

std::optional<double> readMegabytes(const YAML::Node& map, std::string_view key, std::string_view parent) {
    double value = 0;
    const auto node = map[std::string(key)];
    if (!node || node.IsNull()) return std::nullopt;
    value = scalar<double>(node, field(parent, key));
    if (value < 0) {
        throw InvalidDefinitionError(field(parent, key), "must not be negative");
    }
    return value;
}

bool expectedState(const YAML::Node& map, std::string_view parent, std::string_view alias) {
    bool state = true;
    readOptional(map, alias, parent, state);
    readOptional(map, "expected_state", parent, state);
    return state;
}

SetupStep parseSetupStep(const YAML::Node& node, const std::string& name) {
    if (!node.IsMap()) {
        throw InvalidDefinitionError(name, "step must be a mapping");
    }
    SetupStep step;
    const auto type = requireString(node, "type", name);
    readOptional(node, "description", name, step.description);

    if (type == "run_command") {
        step.type = SetupStepType::RunCommand;
        step.command = requireString(node, "command", name);
        readOptional(node, "expected_exit_code", name, step.expectedExitCode);
    } else if (type == "copy_file") {
        step.type = SetupStepType::CopyFile;
        step.localPath = requireString(node, "local", name);
        step.remotePath = requireString(node, "remote", name);
        readOptional(node, "create_dirs", name, step.createDirs);
    } else {
        throw InvalidDefinitionError(field(name, "type"), "unsupported setup step type '" + type + "'");
    }
    return step;
}

ValidationStep parseValidationStep(const YAML::Node& node, const std::string& name) {
    if (!node.IsMap()) {
        throw InvalidDefinitionError(name, "step must be a mapping");
    }
    ValidationStep step;
    const auto type = requireString(node, "type", name);
    readOptional(node, "description", name, step.description);

    if (type == "run_command") {
        step.type = ValidationStepType::RunCommand;
        step.command = requireString(node, "command", name);
        readOptional(node, "expected_exit_code", name, step.expectedExitCode);
        if (const auto criteria = node["success_criteria"]) {
            const auto cname = field(name, "success_criteria");
            if (!criteria.IsMap()) {
                throw InvalidDefinitionError(cname, "must be a mapping");
            }
            readOptional(criteria, "exit_status", cname, step.expectedExitCode);
            std::string value;
            if (criteria["stdout_equals"]) { readOptional(criteria, "stdout_equals", cname, value); step.stdoutEquals = value; }
            if (criteria["stdout_contains"]) { readOptional(criteria, "stdout_contains", cname, value); step.stdoutContains = value; }
            if (criteria["stdout_matches_regex"]) {
                readOptional(criteria, "stdout_matches_regex", cname, value);
                checkRegex(value, field(cname, "stdout_matches_regex"));
                step.stdoutMatchesRegex = value;
            }
        }
    } else if (type == "check_service_status") {
        step.type = ValidationStepType::ServiceStatus;
        step.service = requireString(node, "service", name);
        readOptional(node, "expected_status", name, step.expectedStatus);
        readOptional(node, "check_enabled", name, step.checkEnabled);
        static const std::array<std::string_view, 3> statuses{"active", "inactive", "failed"};
        if (std::find(statuses.begin(), statuses.end(), step.expectedStatus) == statuses.end()) {
            throw InvalidDefinitionError(field(name, "expected_status"), "must be active, inactive or failed");
        }
    } else if (type == "check_port_listening") {
        step.type = ValidationStepType::PortListening;
        if (!node["port"]) {
            throw InvalidDefinitionError(field(name, "port"), "missing required key");
        }
        step.port = scalar<int>(node["port"], field(name, "port"));
        if (step.port < 1 || step.port > 65535) {
            throw InvalidDefinitionError(field(name, "port"), "must be within 1..65535");
        }
        readOptional(node, "protocol", name, step.protocol);
        if (step.protocol != "tcp" && step.protocol != "udp") {
            throw InvalidDefinitionError(field(name, "protocol"), "must be tcp or udp");
        }
        step.expectedState = expectedState(node, name, "should_listen");
    } else if (type == "check_file_exists") {
        step.type = ValidationStepType::FileExists;
        step.path = requireString(node, "path", name);
        readOptional(node, "file_type", name, step.fileType);
        if (step.fileType != "any" && step.fileType != "file" && step.fileType != "directory") {
            throw InvalidDefinitionError(field(name, "file_type"), "must be any, file or directory");
        }
        step.expectedState = expectedState(node, name, "should_exist");
    } else if (type == "check_file_contains") {
        step.type = ValidationStepType::FileContains;
        step.path = requireString(node, "path", name);
        readOptional(node, "text", name, step.text);
        readOptional(node, "matches_regex", name, step.regex);
        if (step.text.empty() && step.regex.empty()) {
            throw InvalidDefinitionError(field(name, "text"), "one of text or matches_regex is required");
        }
        if (!step.text.empty() && !step.regex.empty()) {
            throw InvalidDefinitionError(field(name, "matches_regex"), "cannot be combined with text");
        }
        step.expectedState = expectedState(node, name, "should_contain");
    } else if (type == "check_user_group") {
        step.type = ValidationStepType::UserGroup;
        const auto check = requireString(node, "check_type", name);
        readOptional(node, "user", name, step.user);
        readOptional(node, "username", name, step.user);
        if (step.user.empty()) {
            throw InvalidDefinitionError(field(name, "username"), "missing required key");
        }
        if (check == "user_exists") {
            step.userCheck = UserCheck::UserExists;
        } else if (check == "user_primary_group" || check == "user_in_group") {
            step.userCheck = check == "user_in_group" ? UserCheck::InGroup : UserCheck::PrimaryGroup;
            step.group = requireString(node, "group", name);
        } else if (check == "user_shell") {
            step.userCheck = UserCheck::Shell;
            step.shell = requireString(node, "shell", name);
        } else {
            throw InvalidDefinitionError(field(name, "check_type"), "unsupported check '" + check + "'");
        }
    } else if (type == "check_process") {
        step.type = ValidationStepType::Process;
        step.processName = requireString(node, "process_name", name);
        if (!node["expected_state"]) {
            throw InvalidDefinitionError(field(name, "expected_state"), "missing required key");
        }
        readOptional(node, "expected_state", name, step.expectedState);
        readOptional(node, "pid_file", name, step.pidFile);
    } else if (type == "check_journalctl") {
        step.type = ValidationStepType::Journal;
        step.since = "10 minutes ago";
        readOptional(node, "service", name, step.service);
        readOptional(node, "syslog_identifier", name, step.syslogIdentifier);
        readOptional(node, "command_name", name, step.commandName);
        readOptional(node, "message_pattern", name, step.messagePattern);
        readOptional(node, "since", name, step.since);
        if (!step.messagePattern.empty()) {
            checkRegex(step.messagePattern, field(name, "message_pattern"));
        }
        step.expectedState = expectedState(node, name, "should_exist");
    } else if (type == "check_history") {
        step.type = ValidationStepType::History;
        readOptional(node, "history_command", name, step.historyCommand);
        readOptional(node, "command_pattern", name, step.commandPattern);
        if (const auto banned = node["disallowed_commands"]; banned && !banned.IsNull()) {
            const auto bname = field(name, "disallowed_commands");
            if (!banned.IsSequence()) throw InvalidDefinitionError(bname, "must be a list");
            for (std::size_t i = 0; i < banned.size(); ++i) {
                const auto iname = fmt::format("{}[{}]", bname, i);
                step.disallowedCommands.push_back(scalar<std::string>(banned[i], iname));
                checkRegex(step.disallowedCommands.back(), iname);
            }
        }
        if (step.commandPattern.empty() && step.disallowedCommands.empty()) {
            throw InvalidDefinitionError(field(name, "command_pattern"),
                                         "command_pattern or disallowed_commands is required");
        }
        if (!step.commandPattern.empty()) {
            checkRegex(step.commandPattern, field(name, "command_pattern"));
        }
        if (const auto count = node["expected_count"]; count && !count.IsNull()) {
            const auto cname = field(name, "expected_count");
            if (step.commandPattern.empty()) {
                throw InvalidDefinitionError(cname, "requires command_pattern");
            }
            const auto raw = scalar<std::string>(count, cname);
            step.expectedCount = CountExpectation::parse(raw);
            if (!step.expectedCount) {
                throw InvalidDefinitionError(cname, "'" + raw + "' is not a count such as 1, >0 or <=2");
            }
        }
    } else if (type == "check_audit_log") {
        step.type = ValidationStepType::AuditLog;
        step.ruleKey = requireString(node, "rule_key", name);
        step.since = "recent";
        readOptional(node, "since", name, step.since);
        step.expectedState = expectedState(node, name, "should_exist");
    } else if (type == "check_lvm_state") {
        step.type = ValidationStepType::LvmState;
        const auto check = requireString(node, "check_type", name);
        if (check == "pv_exists") {
            step.lvmCheck = LvmCheck::PvExists;
            step.device = requireString(node, "device", name);
        } else if (check == "vg_exists") {
            step.lvmCheck = LvmCheck::VgExists;
            step.vgName = requireString(node, "vg_name", name);
        } else if (check == "lv_exists" || check == "lv_size") {
            step.lvmCheck = check == "lv_size" ? LvmCheck::LvSize : LvmCheck::LvExists;
            step.vgName = requireString(node, "vg_name", name);
            step.lvName = requireString(node, "lv_name", name);
        } else {
            throw InvalidDefinitionError(field(name, "check_type"), "unsupported LVM check '" + check + "'");
        }
        if (step.lvmCheck == LvmCheck::LvSize) {
            step.minSizeMb = readMegabytes(node, "min_size_mb", name);
            step.maxSizeMb = readMegabytes(node, "max_size_mb", name);
            step.exactSizeMb = readMegabytes(node, "exact_size_mb", name);
            if (!step.minSizeMb && !step.maxSizeMb && !step.exactSizeMb) {
                throw InvalidDefinitionError(field(name, "min_size_mb"),
                                             "one of min_size_mb, max_size_mb or exact_size_mb is required");
            }
        }
        step.expectedState = expectedState(node, name, "should_exist");
    } else {
        throw InvalidDefinitionError(field(name, "type"), "unsupported validation step type '" + type + "'");
    }
    return step;
}

ChallengeDefinition parseDefinition(const YAML::Node& root, std::string_view source) {
    for (const auto& kv : root) {
        if (!kv.first.IsScalar()) {
            throw InvalidDefinitionError("", fmt::format("{}: top-level keys must be plain names", source));
        }
        const auto& key = kv.first.Scalar();
        if (std::find(kAllowedKeys.begin(), kAllowedKeys.end(), key) == kAllowedKeys.end()) {
            BoostLogger::Warn("{}: unknown top-level key '{}'", source, key);
        }
    }

    ChallengeDefinition def;
    def.sourcePath = std::string(source);
    def.id = requireString(root, "id", "");
    if (!ChallengeLoader::isValidId(def.id)) {
        throw InvalidDefinitionError("id", "'" + def.id + "' may only contain letters, digits, '.', '_' and '-'");
    }
    def.name = requireString(root, "name", "");
    def.description = requireString(root, "description", "");
    readOptional(root, "category", "", def.category);
    readOptional(root, "difficulty", "", def.difficulty);
    readOptional(root, "score", "", def.score);
    if (def.score < 0) {
        throw InvalidDefinitionError("score", "must not be negative");
    }
    readOptional(root, "user_action_simulation", "", def.userActionSimulation);
    readOptional(root, "flag", "", def.flag);
    readOptional(root, "simulate", "", def.simulate);
    readOptional(root, "keep_snapshot", "", def.keepSnapshot);

    if (const auto concepts = root["concepts"]) {
        if (!concepts.IsSequence()) throw InvalidDefinitionError("concepts", "must be a list");
        for (std::size_t i = 0; i < concepts.size(); ++i) {
            def.concepts.push_back(scalar<std::string>(concepts[i], fmt::format("concepts[{}]", i)));
        }
    }

    // "steps" هو الاسم المعتمد و"setup" مقبول للملفات القديمة
    const char* stepsKey = root["steps"] ? "steps" : "setup";
    const auto steps = root[stepsKey];
    if (!steps || steps.IsNull()) {
        throw InvalidDefinitionError("steps", "missing required key");
    }
    if (!steps.IsSequence()) {
        throw InvalidDefinitionError(stepsKey, "must be a list");
    }
    for (std::size_t i = 0; i < steps.size(); ++i) {
        def.setup.push_back(parseSetupStep(steps[i], fmt::format("{}[{}]", stepsKey, i)));
    }

    if (const auto validation = root["validation"]; validation && !validation.IsNull()) {
        if (!validation.IsSequence()) throw InvalidDefinitionError("validation", "must be a list");
        for (std::size_t i = 0; i < validation.size(); ++i) {
            def.validation.push_back(parseValidationStep(validation[i], fmt::format("validation[{}]", i)));
        }
    }

    if (const auto hints = root["hints"]; hints && !hints.IsNull()) {
        if (!hints.IsSequence()) throw InvalidDefinitionError("hints", "must be a list");
        for (std::size_t i = 0; i < hints.size(); ++i) {
            const auto name = fmt::format("hints[{}]", i);
            if (!hints[i].IsMap()) throw InvalidDefinitionError(name, "must be a mapping");
            Hint hint;
            hint.text = requireString(hints[i], "text", name);
            readOptional(hints[i], "cost", name, hint.cost);
            def.hints.push_back(std::move(hint));
        }
    }

    return def;
}


} // namespace

bool ChallengeLoader::isValidId(std::string_view id) {
    static const std::regex pattern("^[a-zA-Z0-9._-]+$");
    return std::regex_match(id.begin(), id.end(), pattern);
}

ChallengeDefinition ChallengeLoader::fromYAML(const std::string& text, std::string_view source) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw InvalidDefinitionError("", fmt::format("{}: YAML parse error: {}", source, e.what()));
    }
    if (!root.IsMap()) {
        throw InvalidDefinitionError("", fmt::format("{}: top level must be a mapping", source));
    }
    // أخطاء yaml-cpp المتبقية (عقد من نوع غير متوقع) تُعامل كتعريف غير صالح
    try {
        return parseDefinition(root, source);
    } catch (const YAML::Exception& e) {
        throw InvalidDefinitionError("", fmt::format("{}: {}", source, e.what()));
    }
}

ChallengeDefinition ChallengeLoader::fromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidDefinitionError("", "cannot open challenge file " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return fromYAML(ss.str(), path.string());
}

std::map<std::string, ChallengeDefinition> ChallengeLoader::loadDirectory(const std::filesystem::path& dir) {
    std::map<std::string, ChallengeDefinition> out;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        BoostLogger::Warn("Challenge directory {} does not exist", dir.string());
        return out;
    }

    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        const auto ext = entry.path().extension();
        if (!entry.is_regular_file() || (ext != ".yaml" && ext != ".yml")) continue;
        try {
            auto def = ChallengeLoader::fromFile(entry.path());
            if (out.contains(def.id)) {
                BoostLogger::Warn("Duplicate challenge id '{}' in {}, skipped", def.id, entry.path().string());
                continue;
            }
            auto id = def.id;
            out.emplace(std::move(id), std::move(def));
        } catch (const InvalidDefinitionError& e) {
            BoostLogger::Error("Skipping {}: {}", entry.path().string(), e.what());
        }
    }
    BoostLogger::Info("Loaded {} challenge(s) from {}", out.size(), dir.string());
    return out;
}
