#include "Core/config/LabConfig.hpp"
#include "Utils/Exception.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace {

template <typename T>
void readValue(const YAML::Node& section, const char* key, T& target, const std::string& prefix) {
    if (!section || !section[key]) return;
    try {
        target = section[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw InvalidDefinitionError(prefix + "." + key, e.what());
    }
}

void readSeconds(const YAML::Node& section, const char* key, std::chrono::seconds& target, const std::string& prefix) {
    long long value = target.count();
    readValue(section, key, value, prefix);
    target = std::chrono::seconds(value);
}

} // namespace

LabConfig LabConfig::fromYAML(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw InvalidDefinitionError("config", e.what());
    }

    LabConfig cfg;
    if (root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw InvalidDefinitionError("config", "top level must be a mapping");
    }

    const auto hv = root["hypervisor"];
    readValue(hv, "uri", cfg.hypervisor.uri, "hypervisor");
    readValue(hv, "default_vm", cfg.hypervisor.defaultVm, "hypervisor");
    readSeconds(hv, "shutdown_timeout", cfg.hypervisor.shutdownTimeout, "hypervisor");

    const auto ssh = root["ssh"];
    readValue(ssh, "user", cfg.ssh.user, "ssh");
    readValue(ssh, "key", cfg.ssh.keyPath, "ssh");
    readValue(ssh, "port", cfg.ssh.port, "ssh");
    readSeconds(ssh, "connect_timeout", cfg.ssh.connectTimeout, "ssh");
    readSeconds(ssh, "command_timeout", cfg.ssh.commandTimeout, "ssh");

    const auto ready = root["readiness"];
    readSeconds(ready, "timeout", cfg.readiness.timeout, "readiness");
    readSeconds(ready, "poll_interval", cfg.readiness.pollInterval, "readiness");

    const auto snap = root["snapshot"];
    readValue(snap, "freeze_fs", cfg.snapshot.freezeFs, "snapshot");
    readValue(snap, "prefix", cfg.snapshot.prefix, "snapshot");

    readValue(root["challenges"], "directory", cfg.challengesDirectory, "challenges");
    readValue(root["sessions"], "store_path", cfg.sessionStorePath, "sessions");

    if (const auto log = root["logging"]) {
        std::string level;
        readValue(log, "level", level, "logging");
        if (!level.empty()) {
            cfg.logging.console_level = BoostLogger::ParseLevel(level, cfg.logging.console_level);
        }
        readValue(log, "file", cfg.logging.file_path, "logging");
        readValue(log, "console", cfg.logging.enable_console, "logging");
        std::size_t rotationMb = cfg.logging.rotation_size / (1024 * 1024);
        readValue(log, "rotation_size_mb", rotationMb, "logging");
        cfg.logging.rotation_size = rotationMb * 1024 * 1024;
        readValue(log, "max_files", cfg.logging.max_files, "logging");
        cfg.logging.enable_file = !cfg.logging.file_path.empty();
    }

    cfg.validate();
    return cfg;
}

LabConfig LabConfig::fromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidDefinitionError("config", "cannot open " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return fromYAML(ss.str());
}

void LabConfig::validate() const {
    if (hypervisor.uri.empty()) {
        throw InvalidDefinitionError("hypervisor.uri", "must not be empty");
    }
    if (hypervisor.shutdownTimeout.count() < 0) {
        throw InvalidDefinitionError("hypervisor.shutdown_timeout", "must not be negative");
    }
    if (ssh.user.empty()) {
        throw InvalidDefinitionError("ssh.user", "must not be empty");
    }
    if (ssh.port < 1 || ssh.port > 65535) {
        throw InvalidDefinitionError("ssh.port", "must be within 1..65535");
    }
    if (ssh.connectTimeout.count() <= 0) {
        throw InvalidDefinitionError("ssh.connect_timeout", "must be positive");
    }
    if (ssh.commandTimeout.count() <= 0) {
        throw InvalidDefinitionError("ssh.command_timeout", "must be positive");
    }
    if (readiness.timeout.count() <= 0) {
        throw InvalidDefinitionError("readiness.timeout", "must be positive");
    }
    if (readiness.pollInterval.count() <= 0) {
        throw InvalidDefinitionError("readiness.poll_interval", "must be positive");
    }
    if (readiness.pollInterval > readiness.timeout) {
        throw InvalidDefinitionError("readiness.poll_interval", "must not exceed readiness.timeout");
    }
    if (logging.max_files < 1) {
        throw InvalidDefinitionError("logging.max_files", "must be at least 1");
    }
}
