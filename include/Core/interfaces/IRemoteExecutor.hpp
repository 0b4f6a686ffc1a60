#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include "Core/concurrency/CancelFlag.hpp"
#include "Remote/ssh/SshTypes.hpp"

class IRemoteExecutor {
public:
    virtual ~IRemoteExecutor() noexcept = default;

    // اتصال جديد لكل أمر؛ لا إعادة محاولة داخلية
    virtual CommandResult runCommand(const SshTarget& target, const std::string& command,
                                     std::chrono::seconds timeout,
                                     const std::optional<std::string>& stdinData) = 0;

    virtual bool testConnectivity(const SshTarget& target, std::chrono::seconds timeout) = 0;

    virtual bool waitUntilReady(const SshTarget& target, std::chrono::seconds totalTimeout,
                                std::chrono::seconds pollInterval,
                                const CONCURRENCY::CancelFlag& cancel) = 0;

    virtual bool copyFile(const SshTarget& target, const std::filesystem::path& localPath,
                          const std::string& remotePath, bool createDirs) = 0;
};
