#pragma once

#include <mutex>
#include <regex>
#include <string>
#include <vector>
#include "Core/interfaces/IRemoteExecutor.hpp"

// ضيف وهمي يفهم أوامر hostname فقط
class FakeGuest : public IRemoteExecutor {
public:
    std::string hostname{"original-host"};
    std::string etcHostname{"original-host\n"};
    bool ready{true};
    std::vector<std::string> commands;

    void takeSnapshot() { saved_ = {hostname, etcHostname}; }
    void restoreSnapshot() {
        hostname = saved_.first;
        etcHostname = saved_.second;
    }

    CommandResult runCommand(const SshTarget&, const std::string& command, std::chrono::seconds,
                             const std::optional<std::string>&) override {
        std::lock_guard lock(mutex_);
        commands.push_back(command);

        static const std::regex setHostname(R"(^sudo hostnamectl set-hostname (\S+) --static$)");
        static const std::regex grepFixed(R"(^grep -q -F -- '([^']*)' '([^']*)'$)");
        std::smatch m;

        if (std::regex_match(command, m, setHostname)) {
            hostname = m[1];
            etcHostname = hostname + "\n";
            return CommandResult::fromExit(0, "", "");
        }
        if (command == "hostname") {
            return CommandResult::fromExit(0, hostname + "\n", "");
        }
        if (std::regex_match(command, m, grepFixed)) {
            if (m[2] != "/etc/hostname") return CommandResult::fromExit(2, "", "grep: " + m[2].str() + ": No such file or directory\n");
            const bool found = etcHostname.find(m[1]) != std::string::npos;
            return CommandResult::fromExit(found ? 0 : 1, "", "");
        }
        return CommandResult::fromExit(127, "", "sh: 1: " + command + ": not found\n");
    }

    bool testConnectivity(const SshTarget&, std::chrono::seconds) override { return ready; }

    bool waitUntilReady(const SshTarget&, std::chrono::seconds, std::chrono::seconds,
                        const CONCURRENCY::CancelFlag&) override {
        return ready;
    }

    bool copyFile(const SshTarget&, const std::filesystem::path&, const std::string&, bool) override {
        return true;
    }

private:
    std::mutex mutex_;
    std::pair<std::string, std::string> saved_;
};
