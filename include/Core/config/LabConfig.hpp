#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include "Utils/Logger.hpp"

struct HypervisorSettings {
    std::string uri{"qemu:///system"};
    std::string defaultVm{"ubuntu22.04-1"};
    std::chrono::seconds shutdownTimeout{120};
};

struct SshSettings {
    std::string user{"roo"};
    std::string keyPath{"~/.ssh/id_ed25519"};
    int port{22};
    std::chrono::seconds connectTimeout{10};
    std::chrono::seconds commandTimeout{120};
};

struct ReadinessSettings {
    std::chrono::seconds timeout{120};
    std::chrono::seconds pollInterval{5};
};

struct SnapshotSettings {
    bool freezeFs{true};
    std::string prefix{"practice"};
};

struct LabConfig {
    HypervisorSettings hypervisor;
    SshSettings ssh;
    ReadinessSettings readiness;
    SnapshotSettings snapshot;
    std::string challengesDirectory{"challenges"};
    std::string sessionStorePath{"~/.local/share/practicelab/sessions"};
    BoostLogger::Config logging;

    // التهيئة من YAML (كل المفاتيح اختيارية)
    static LabConfig fromYAML(const std::string& text);
    static LabConfig fromFile(const std::filesystem::path& path);

    // يرمي InvalidDefinitionError مع اسم المفتاح
    void validate() const;
};
