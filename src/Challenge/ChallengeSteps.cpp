#include "Challenge/ChallengeSteps.hpp"
#include "Utils/PathUtils.hpp"
#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <regex>
#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <charconv>
#include <stdexcept>
#include <vector>

using PathUtils::shellQuote;

namespace {

std::string trimmed(const std::string& s) {
    return boost::algorithm::trim_copy(s);
}

std::string existence(bool state) {
    return state ? "present" : "absent";
}

std::string found(bool state) {
    return state ? "found" : "not found";
}

// grep وpgrep: 0 وجد، 1 لم يجد، أكبر من ذلك خطأ
bool toolFailed(int exit) {
    return exit < 0 || exit > 1;
}

std::string toolFailure(std::string_view tool, int exit, const std::string& stderrText) {
    auto reason = fmt::format("{} failed with exit code {}", tool, exit);
    if (const auto err = trimmed(stderrText); !err.empty()) {
        reason += ": " + err;
    }
    return reason;
}

std::string quotedWords(const std::string& text) {
    std::vector<std::string> words;
    boost::algorithm::split(words, text, boost::is_any_of(" \t"), boost::token_compress_on);
    std::string out;
    for (const auto& w : words) {
        if (w.empty()) continue;
        if (!out.empty()) out += ' ';
        out += shellQuote(w);
    }
    return out;
}

// ^ و$ تطابق بداية ونهاية كل سطر
int countMatches(const std::string& pattern, const std::string& text) {
    const std::regex re(pattern);
    std::vector<std::string> lines;
    boost::algorithm::split(lines, text, boost::is_any_of("\n"));
    int count = 0;
    for (const auto& line : lines) {
        count += static_cast<int>(std::distance(std::sregex_iterator(line.begin(), line.end(), re),
                                                std::sregex_iterator()));
    }
    return count;
}

std::optional<double> parseMegabytes(std::string text) {
    text.erase(std::remove_if(text.begin(), text.end(),
                              [](char c) { return c == '<' || c == 'm' || c == 'M' || c == ' ' || c == '\n'; }),
               text.end());
    if (text.empty()) return std::nullopt;
    try {
        std::size_t used = 0;
        const double value = std::stod(text, &used);
        if (used != text.size()) return std::nullopt;
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

} // namespace

std::optional<CountExpectation> CountExpectation::parse(std::string_view raw) {
    const auto trimmedText = boost::algorithm::trim_copy(std::string(raw));
    const std::string_view text(trimmedText);
    std::size_t opLen = 0;
    while (opLen < text.size() && (text[opLen] == '<' || text[opLen] == '>' || text[opLen] == '=' || text[opLen] == '!')) {
        ++opLen;
    }
    CountExpectation out;
    out.op = opLen == 0 ? "==" : std::string(text.substr(0, opLen));
    static const std::array<std::string_view, 6> ops{">", ">=", "<", "<=", "==", "!="};
    if (std::find(ops.begin(), ops.end(), out.op) == ops.end()) return std::nullopt;

    auto rest = boost::algorithm::trim_copy(std::string(text.substr(opLen)));
    if (rest.empty()) return std::nullopt;
    const auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), out.value);
    if (ec != std::errc() || ptr != rest.data() + rest.size() || out.value < 0) return std::nullopt;
    return out;
}

bool CountExpectation::matches(int count) const noexcept {
    if (op == ">")  return count > value;
    if (op == ">=") return count >= value;
    if (op == "<")  return count < value;
    if (op == "<=") return count <= value;
    if (op == "!=") return count != value;
    return count == value;
}

std::string CountExpectation::str() const {
    return op + std::to_string(value);
}

std::string SetupStep::summary() const {
    if (!description.empty()) return description;
    if (type == SetupStepType::CopyFile) {
        return fmt::format("copy {} -> {}", localPath, remotePath);
    }
    return command;
}

std::string_view toString(ValidationStepType type) noexcept {
    switch (type) {
        case ValidationStepType::RunCommand:    return "run_command";
        case ValidationStepType::ServiceStatus: return "check_service_status";
        case ValidationStepType::PortListening: return "check_port_listening";
        case ValidationStepType::FileExists:    return "check_file_exists";
        case ValidationStepType::FileContains:  return "check_file_contains";
        case ValidationStepType::UserGroup:     return "check_user_group";
        case ValidationStepType::Process:       return "check_process";
        case ValidationStepType::Journal:       return "check_journalctl";
        case ValidationStepType::History:       return "check_history";
        case ValidationStepType::AuditLog:      return "check_audit_log";
        case ValidationStepType::LvmState:      return "check_lvm_state";
    }
    return "run_command";
}

std::string ValidationStep::buildCommand() const {
    switch (type) {
        case ValidationStepType::RunCommand:
            return command;

        case ValidationStepType::ServiceStatus: {
            auto cmd = fmt::format("systemctl is-active {}", shellQuote(service));
            if (checkEnabled) {
                cmd += fmt::format("; systemctl is-enabled {}", shellQuote(service));
            }
            return cmd;
        }

        case ValidationStepType::PortListening: {
            const char* flags = protocol == "udp" ? "-ulnp" : "-tlnp";
            return fmt::format("ss {0} | grep ':{1} ' || netstat {0} | grep ':{1} '", flags, port);
        }

        case ValidationStepType::FileExists: {
            const char* test = fileType == "file" ? "-f" : fileType == "directory" ? "-d" : "-e";
            return fmt::format("test {} {}", test, shellQuote(path));
        }

        case ValidationStepType::FileContains:
            if (!regex.empty()) {
                return fmt::format("grep -q -E -- {} {}", shellQuote(regex), shellQuote(path));
            }
            return fmt::format("grep -q -F -- {} {}", shellQuote(text), shellQuote(path));

        case ValidationStepType::Process: {
            auto cmd = fmt::format("pgrep -x -- {}", shellQuote(processName));
            if (pidFile.empty()) return cmd;
            return fmt::format("{} >/dev/null; rc=$?; [ $rc -gt 1 ] && exit $rc; "
                               "if test -f {}; then echo 'pid-file: present'; else echo 'pid-file: absent'; fi; exit $rc",
                               cmd, shellQuote(pidFile));
        }

        case ValidationStepType::Journal: {
            std::string cmd = "journalctl --no-pager --quiet";
            if (!since.empty()) cmd += " --since " + shellQuote(since);
            if (!service.empty()) cmd += " -u " + shellQuote(service);
            if (!syslogIdentifier.empty()) cmd += " " + shellQuote("SYSLOG_IDENTIFIER=" + syslogIdentifier);
            if (!commandName.empty()) cmd += " " + shellQuote("_COMM=" + commandName);
            if (!messagePattern.empty()) {
                return cmd + " | grep -q -E -- " + shellQuote(messagePattern);
            }
            return cmd + " | grep -q .";
        }

        case ValidationStepType::History:
            return historyCommand;

        case ValidationStepType::AuditLog: {
            auto cmd = fmt::format("ausearch --input-logs -k {}", shellQuote(ruleKey));
            if (!since.empty()) cmd += " --start " + quotedWords(since);
            return cmd;
        }

        case ValidationStepType::LvmState:
            switch (lvmCheck) {
                case LvmCheck::PvExists: return fmt::format("pvs --noheadings -o pv_name {}", shellQuote(device));
                case LvmCheck::VgExists: return fmt::format("vgs --noheadings -o vg_name {}", shellQuote(vgName));
                case LvmCheck::LvExists:
                    return fmt::format("lvs --noheadings -o lv_name {}", shellQuote(vgName + "/" + lvName));
                case LvmCheck::LvSize:
                    return fmt::format("lvs --noheadings --units m -o lv_size {}", shellQuote(vgName + "/" + lvName));
            }
            break;

        case ValidationStepType::UserGroup:
            switch (userCheck) {
                case UserCheck::UserExists:   return fmt::format("id {}", shellQuote(user));
                case UserCheck::PrimaryGroup: return fmt::format("id -gn {}", shellQuote(user));
                case UserCheck::InGroup:      return fmt::format("id -nG {}", shellQuote(user));
                case UserCheck::Shell:        return fmt::format("getent passwd {} | cut -d: -f7", shellQuote(user));
            }
            break;
    }
    return command;
}

StepOutcome ValidationStep::evaluate(const CommandResult& result) const {
    StepOutcome out;
    out.kind = std::string(toString(type));
    out.description = description;
    out.command = buildCommand();
    out.exitCode = result.exitCode;
    out.stdoutText = result.stdoutText;
    out.stderrText = result.stderrText;

    const int exit = result.exitCode.value_or(-1);
    const auto stdoutTrim = trimmed(result.stdoutText);

    switch (type) {
        case ValidationStepType::RunCommand:
            if (exit != expectedExitCode) {
                out.reason = fmt::format("exit code {} (expected {})", exit, expectedExitCode);
                if (const auto err = trimmed(result.stderrText); !err.empty()) {
                    out.reason += ": " + err;
                }
                break;
            }
            if (stdoutEquals && stdoutTrim != trimmed(*stdoutEquals)) {
                out.reason = fmt::format("stdout '{}' (expected '{}')", stdoutTrim, trimmed(*stdoutEquals));
                break;
            }
            if (stdoutContains && result.stdoutText.find(*stdoutContains) == std::string::npos) {
                out.reason = fmt::format("stdout does not contain '{}'", *stdoutContains);
                break;
            }
            if (stdoutMatchesRegex) {
                try {
                    if (!std::regex_search(result.stdoutText, std::regex(*stdoutMatchesRegex))) {
                        out.reason = fmt::format("stdout does not match /{}/", *stdoutMatchesRegex);
                        break;
                    }
                } catch (const std::regex_error& e) {
                    out.reason = fmt::format("invalid regex /{}/: {}", *stdoutMatchesRegex, e.what());
                    break;
                }
            }
            out.passed = true;
            break;

        case ValidationStepType::ServiceStatus: {
            std::vector<std::string> lines;
            boost::algorithm::split(lines, stdoutTrim, boost::is_any_of("\n"));
            const auto status = lines.empty() ? std::string{} : boost::algorithm::to_lower_copy(trimmed(lines[0]));
            if (status != boost::algorithm::to_lower_copy(expectedStatus)) {
                out.reason = fmt::format("service '{}' is '{}' (expected '{}')", service, status, expectedStatus);
                break;
            }
            if (checkEnabled) {
                const auto enabled = lines.size() > 1 ? trimmed(lines[1]) : std::string{};
                if (enabled != "enabled") {
                    out.reason = fmt::format("service '{}' is not enabled ('{}')", service, enabled);
                    break;
                }
            }
            out.passed = true;
            break;
        }

        case ValidationStepType::PortListening: {
            const bool listening = exit == 0;
            out.passed = listening == expectedState;
            if (!out.passed) {
                out.reason = fmt::format("port {}/{} is {}listening", port, protocol, listening ? "" : "not ");
            }
            break;
        }

        case ValidationStepType::FileExists: {
            const bool found = exit == 0;
            out.passed = found == expectedState;
            if (!out.passed) {
                out.reason = fmt::format("'{}' ({}) is {} (expected {})", path, fileType, existence(found), existence(expectedState));
            }
            break;
        }

        case ValidationStepType::FileContains: {
            if (toolFailed(exit)) {
                out.reason = toolFailure(fmt::format("grep on '{}'", path), exit, result.stderrText);
                break;
            }
            const bool hit = exit == 0;
            out.passed = hit == expectedState;
            if (!out.passed) {
                const auto& needle = regex.empty() ? text : regex;
                out.reason = fmt::format("'{}' {} in '{}' (expected {})", needle, found(hit), path, found(expectedState));
            }
            break;
        }

        case ValidationStepType::Process: {
            if (toolFailed(exit)) {
                out.reason = toolFailure(fmt::format("pgrep for '{}'", processName), exit, result.stderrText);
                break;
            }
            const bool running = exit == 0;
            if (running != expectedState) {
                out.reason = fmt::format("process '{}' is {}running (expected {}running)", processName,
                                         running ? "" : "not ", expectedState ? "" : "not ");
                break;
            }
            if (!pidFile.empty()) {
                const bool present = result.stdoutText.find("pid-file: present") != std::string::npos;
                if (present != expectedState) {
                    out.reason = fmt::format("pid file '{}' is {} (expected {})", pidFile, existence(present),
                                             existence(expectedState));
                    break;
                }
            }
            out.passed = true;
            break;
        }

        case ValidationStepType::Journal: {
            if (toolFailed(exit)) {
                out.reason = toolFailure("journal query", exit, result.stderrText);
                break;
            }
            const bool hit = exit == 0;
            out.passed = hit == expectedState;
            if (!out.passed) {
                out.reason = fmt::format("journal entries{} since '{}' {} (expected {})",
                                         messagePattern.empty() ? "" : " matching /" + messagePattern + "/",
                                         since, found(hit), found(expectedState));
            }
            break;
        }

        case ValidationStepType::History: {
            std::vector<std::string> reasons;
            try {
                if (!commandPattern.empty()) {
                    const int count = countMatches(commandPattern, result.stdoutText);
                    if (expectedCount && !expectedCount->matches(count)) {
                        reasons.push_back(fmt::format("pattern /{}/ matched {} time(s) (expected {})",
                                                      commandPattern, count, expectedCount->str()));
                    } else if (!expectedCount && count == 0) {
                        reasons.push_back(fmt::format("pattern /{}/ not found in history", commandPattern));
                    }
                }
                for (const auto& banned : disallowedCommands) {
                    if (countMatches(banned, result.stdoutText) > 0) {
                        reasons.push_back(fmt::format("disallowed pattern /{}/ found in history", banned));
                    }
                }
            } catch (const std::regex_error& e) {
                reasons.push_back(fmt::format("invalid history pattern: {}", e.what()));
            }
            out.passed = reasons.empty();
            out.reason = boost::algorithm::join(reasons, "; ");
            break;
        }

        case ValidationStepType::AuditLog: {
            const bool noMatches = exit == 1 && result.stderrText.find("no matches") != std::string::npos;
            if (exit != 0 && !noMatches) {
                out.reason = toolFailure("ausearch", exit, result.stderrText);
                break;
            }
            const bool hit = exit == 0;
            out.passed = hit == expectedState;
            if (!out.passed) {
                out.reason = fmt::format("audit entries for key '{}' {} (expected {})", ruleKey, found(hit),
                                         found(expectedState));
            }
            break;
        }

        case ValidationStepType::LvmState: {
            if (lvmCheck != LvmCheck::LvSize) {
                const bool hit = exit == 0;
                out.passed = hit == expectedState;
                if (!out.passed) {
                    const auto what = lvmCheck == LvmCheck::PvExists ? "physical volume '" + device + "'"
                                    : lvmCheck == LvmCheck::VgExists ? "volume group '" + vgName + "'"
                                    : "logical volume '" + vgName + "/" + lvName + "'";
                    out.reason = fmt::format("{} is {} (expected {})", what, existence(hit), existence(expectedState));
                }
                break;
            }
            if (exit != 0) {
                out.reason = toolFailure(fmt::format("lvs for '{}/{}'", vgName, lvName), exit, result.stderrText);
                break;
            }
            const auto size = parseMegabytes(stdoutTrim);
            if (!size) {
                out.reason = fmt::format("cannot parse logical volume size '{}'", stdoutTrim);
                break;
            }
            if (exactSizeMb && std::abs(*size - *exactSizeMb) > 0.1) {
                out.reason = fmt::format("size {:.2f}MB (expected exactly {}MB)", *size, *exactSizeMb);
            } else if (minSizeMb && *size < *minSizeMb) {
                out.reason = fmt::format("size {:.2f}MB is below {}MB", *size, *minSizeMb);
            } else if (maxSizeMb && *size > *maxSizeMb) {
                out.reason = fmt::format("size {:.2f}MB is above {}MB", *size, *maxSizeMb);
            } else {
                out.passed = true;
            }
            break;
        }

        case ValidationStepType::UserGroup:
            if (exit != 0) {
                out.reason = userCheck == UserCheck::UserExists
                    ? fmt::format("user '{}' does not exist", user)
                    : fmt::format("cannot query user '{}'", user);
                break;
            }
            switch (userCheck) {
                case UserCheck::UserExists:
                    out.passed = true;
                    break;
                case UserCheck::PrimaryGroup:
                    out.passed = stdoutTrim == group;
                    if (!out.passed) out.reason = fmt::format("primary group of '{}' is '{}' (expected '{}')", user, stdoutTrim, group);
                    break;
                case UserCheck::InGroup: {
                    std::vector<std::string> groups;
                    boost::algorithm::split(groups, stdoutTrim, boost::is_any_of(" \t"), boost::token_compress_on);
                    out.passed = std::find(groups.begin(), groups.end(), group) != groups.end();
                    if (!out.passed) out.reason = fmt::format("'{}' is not in group '{}' (groups: {})", user, group, stdoutTrim);
                    break;
                }
                case UserCheck::Shell:
                    out.passed = stdoutTrim == shell;
                    if (!out.passed) out.reason = fmt::format("shell of '{}' is '{}' (expected '{}')", user, stdoutTrim, shell);
                    break;
            }
            break;
    }
    return out;
}
