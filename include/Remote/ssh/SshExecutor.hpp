#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <libssh/libssh.h>
#include "Core/interfaces/IRemoteExecutor.hpp"

/**
 * @brief libssh implementation of IRemoteExecutor.
 *
 * Every call opens and closes its own connection; host keys are not
 * checked since lab guests are recreated from snapshots.
 */
class SshExecutor : public IRemoteExecutor {
public:
    explicit SshExecutor(std::chrono::seconds connectTimeout = std::chrono::seconds(10));
    ~SshExecutor() override = default;

    SshExecutor(const SshExecutor&) = delete;
    SshExecutor& operator=(const SshExecutor&) = delete;

    CommandResult runCommand(const SshTarget& target, const std::string& command,
                             std::chrono::seconds timeout,
                             const std::optional<std::string>& stdinData) override;

    bool testConnectivity(const SshTarget& target, std::chrono::seconds timeout) override;

    bool waitUntilReady(const SshTarget& target, std::chrono::seconds totalTimeout,
                        std::chrono::seconds pollInterval,
                        const CONCURRENCY::CancelFlag& cancel) override;

    bool copyFile(const SshTarget& target, const std::filesystem::path& localPath,
                  const std::string& remotePath, bool createDirs) override;

private:
    struct SessionCloser {
        void operator()(ssh_session s) const noexcept;
    };
    using SessionPtr = std::unique_ptr<ssh_session_struct, SessionCloser>;

    std::chrono::seconds connectTimeout;

    // اتصال + مصادقة بالمفتاح؛ KeyError قبل أي اتصال شبكي
    [[nodiscard]] std::expected<SessionPtr, SshFailure> open(const SshTarget& target,
                                                             std::chrono::milliseconds timeout) const;
    [[nodiscard]] CommandResult execute(const SshTarget& target, const std::string& command,
                                        std::chrono::milliseconds timeout,
                                        const std::optional<std::string>& stdinData) const;
    [[nodiscard]] std::optional<SshFailure> probe(const SshTarget& target, std::chrono::milliseconds timeout) const;
};
