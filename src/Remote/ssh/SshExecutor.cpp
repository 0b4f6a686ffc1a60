#include "Remote/ssh/SshExecutor.hpp"
#include "Remote/ssh/ReadinessPoller.hpp"
#include "Remote/ssh/SshKey.hpp"
#include "Utils/Exception.hpp"
#include "Utils/Logger.hpp"
#include "Utils/PathUtils.hpp"
#include <libssh/sftp.h>
#include <algorithm>
#include <array>
#include <fcntl.h>
#include <fstream>
#include <string_view>
#include <vector>
#include <fmt/format.h>

using namespace std::chrono_literals;

namespace {

struct ChannelCloser {
    void operator()(ssh_channel ch) const noexcept {
        if (ssh_channel_is_open(ch)) ssh_channel_close(ch);
        ssh_channel_free(ch);
    }
};
using ChannelPtr = std::unique_ptr<ssh_channel_struct, ChannelCloser>;

struct SftpCloser {
    void operator()(sftp_session s) const noexcept { sftp_free(s); }
};
using SftpPtr = std::unique_ptr<sftp_session_struct, SftpCloser>;

struct KeyCloser {
    void operator()(ssh_key k) const noexcept { ssh_key_free(k); }
};
using KeyPtr = std::unique_ptr<ssh_key_struct, KeyCloser>;

SshFailureKind classifyConnectError(std::string_view message) {
    if (message.find("imeout") != std::string_view::npos || message.find("timed out") != std::string_view::npos) {
        return SshFailureKind::Timeout;
    }
    return SshFailureKind::Network;
}

std::string endpoint(const SshTarget& target) {
    return fmt::format("{}@{}:{}", target.user, target.host, target.port);
}

} // namespace

void SshExecutor::SessionCloser::operator()(ssh_session s) const noexcept {
    if (ssh_is_connected(s)) ssh_disconnect(s);
    ssh_free(s);
}

SshExecutor::SshExecutor(std::chrono::seconds timeout) : connectTimeout(timeout) {}

std::expected<SshExecutor::SessionPtr, SshFailure> SshExecutor::open(const SshTarget& target,
                                                                     std::chrono::milliseconds timeout) const {
    const auto keyPath = SshKey::validate(target.keyPath);

    ssh_key rawKey = nullptr;
    if (ssh_pki_import_privkey_file(keyPath.c_str(), nullptr, nullptr, nullptr, &rawKey) != SSH_OK) {
        throw KeyError("cannot load SSH private key " + keyPath.string());
    }
    KeyPtr key(rawKey);

    SessionPtr session(ssh_new());
    if (!session) {
        return std::unexpected(SshFailure{SshFailureKind::Protocol, "ssh_new failed"});
    }

    const long timeoutUsec = static_cast<long>(std::chrono::duration_cast<std::chrono::microseconds>(timeout).count());
    const long timeoutSec = 0;
    unsigned int port = static_cast<unsigned int>(target.port);
    int strict = 0;
    ssh_options_set(session.get(), SSH_OPTIONS_HOST, target.host.c_str());
    ssh_options_set(session.get(), SSH_OPTIONS_USER, target.user.c_str());
    ssh_options_set(session.get(), SSH_OPTIONS_PORT, &port);
    ssh_options_set(session.get(), SSH_OPTIONS_TIMEOUT, &timeoutSec);
    ssh_options_set(session.get(), SSH_OPTIONS_TIMEOUT_USEC, &timeoutUsec);
    ssh_options_set(session.get(), SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);
    ssh_options_set(session.get(), SSH_OPTIONS_KNOWNHOSTS, "/dev/null");

    if (ssh_connect(session.get()) != SSH_OK) {
        const std::string msg = ssh_get_error(session.get());
        return std::unexpected(SshFailure{classifyConnectError(msg), fmt::format("connect {}: {}", endpoint(target), msg)});
    }

    const int rc = ssh_userauth_publickey(session.get(), nullptr, key.get());
    if (rc != SSH_AUTH_SUCCESS) {
        const std::string msg = rc == SSH_AUTH_ERROR ? ssh_get_error(session.get()) : "public key rejected";
        return std::unexpected(SshFailure{SshFailureKind::Auth, fmt::format("auth {}: {}", endpoint(target), msg)});
    }
    return session;
}

CommandResult SshExecutor::execute(const SshTarget& target, const std::string& command,
                                   std::chrono::milliseconds timeout,
                                   const std::optional<std::string>& stdinData) const {
    auto session = open(target, std::min<std::chrono::milliseconds>(timeout, connectTimeout));
    if (!session) {
        return CommandResult::fromFailure(session.error().kind, session.error().message);
    }
    ssh_session s = session->get();

    ChannelPtr channel(ssh_channel_new(s));
    if (!channel || ssh_channel_open_session(channel.get()) != SSH_OK) {
        return CommandResult::fromFailure(SshFailureKind::Protocol, fmt::format("open channel: {}", ssh_get_error(s)));
    }
    if (ssh_channel_request_exec(channel.get(), command.c_str()) != SSH_OK) {
        return CommandResult::fromFailure(SshFailureKind::Protocol, fmt::format("exec: {}", ssh_get_error(s)));
    }

    if (stdinData) {
        const auto* data = stdinData->data();
        std::size_t left = stdinData->size();
        while (left > 0) {
            const int n = ssh_channel_write(channel.get(), data, static_cast<uint32_t>(left));
            if (n == SSH_ERROR) {
                return CommandResult::fromFailure(SshFailureKind::Protocol, fmt::format("write stdin: {}", ssh_get_error(s)));
            }
            data += n;
            left -= static_cast<std::size_t>(n);
        }
    }
    ssh_channel_send_eof(channel.get());

    std::string out;
    std::string err;
    std::array<char, 4096> buf{};
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    auto drain = [&](int isStderr, int waitMs) -> int {
        const int n = ssh_channel_read_timeout(channel.get(), buf.data(), buf.size(), isStderr, waitMs);
        if (n > 0) (isStderr ? err : out).append(buf.data(), static_cast<std::size_t>(n));
        return n;
    };

    while (!ssh_channel_is_eof(channel.get())) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return CommandResult::fromFailure(SshFailureKind::Timeout,
                fmt::format("command exceeded {}ms on {}", timeout.count(), endpoint(target)));
        }
        if (drain(0, 100) == SSH_ERROR || drain(1, 0) == SSH_ERROR) {
            return CommandResult::fromFailure(SshFailureKind::Protocol, fmt::format("read: {}", ssh_get_error(s)));
        }
    }
    while (drain(0, 0) > 0) {}
    while (drain(1, 0) > 0) {}

    const int exitCode = ssh_channel_get_exit_status(channel.get());
    if (exitCode < 0) {
        return CommandResult::fromFailure(SshFailureKind::Protocol, "remote command ended without exit status");
    }
    return CommandResult::fromExit(exitCode, std::move(out), std::move(err));
}

CommandResult SshExecutor::runCommand(const SshTarget& target, const std::string& command,
                                      std::chrono::seconds timeout,
                                      const std::optional<std::string>& stdinData) {
    BoostLogger::Debug("SSH {} $ {}", endpoint(target), command);
    auto result = execute(target, command, timeout, stdinData);
    if (result.error) {
        BoostLogger::Warn("SSH {} failed ({}): {}", endpoint(target), toString(result.error->kind), result.error->message);
    } else {
        BoostLogger::Debug("SSH {} exit {}", endpoint(target), *result.exitCode);
    }
    return result;
}

std::optional<SshFailure> SshExecutor::probe(const SshTarget& target, std::chrono::milliseconds timeout) const {
    const auto result = execute(target, "true", timeout, std::nullopt);
    if (result.error) return result.error;
    if (result.exitCode != 0) {
        return SshFailure{SshFailureKind::Protocol, fmt::format("probe exited with {}", *result.exitCode)};
    }
    return std::nullopt;
}

bool SshExecutor::testConnectivity(const SshTarget& target, std::chrono::seconds timeout) {
    return !probe(target, timeout).has_value();
}

bool SshExecutor::waitUntilReady(const SshTarget& target, std::chrono::seconds totalTimeout,
                                 std::chrono::seconds pollInterval,
                                 const CONCURRENCY::CancelFlag& cancel) {
    // خطأ المفتاح يظهر فورًا ولا يُعاد
    [[maybe_unused]] const auto key = SshKey::validate(target.keyPath);

    ReadinessPoller poller(totalTimeout, pollInterval);
    return poller.run([&](std::chrono::milliseconds attempt) { return probe(target, attempt); },
                      "SSH " + endpoint(target), cancel);
}

bool SshExecutor::copyFile(const SshTarget& target, const std::filesystem::path& localPath,
                           const std::string& remotePath, bool createDirs) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(localPath, ec)) {
        BoostLogger::Error("Copy source {} is not a regular file", localPath.string());
        return false;
    }
    const auto localPerms = std::filesystem::status(localPath, ec).permissions();

    auto session = open(target, connectTimeout);
    if (!session) {
        BoostLogger::Error("Copy to {} failed ({}): {}", endpoint(target), toString(session.error().kind), session.error().message);
        return false;
    }
    ssh_session s = session->get();

    SftpPtr sftp(sftp_new(s));
    if (!sftp || sftp_init(sftp.get()) != SSH_OK) {
        BoostLogger::Error("sftp init on {} failed: {}", endpoint(target), ssh_get_error(s));
        return false;
    }

    if (createDirs) {
        // نصعد حتى أول مجلد موجود ثم ننشئ نزولاً
        std::vector<std::string> toCreate;
        std::string dir = PathUtils::remoteParent(remotePath);
        while (dir != "/" && dir != ".") {
            sftp_attributes attrs = sftp_stat(sftp.get(), dir.c_str());
            if (attrs) {
                sftp_attributes_free(attrs);
                break;
            }
            toCreate.push_back(dir);
            dir = PathUtils::remoteParent(dir);
        }
        for (auto it = toCreate.rbegin(); it != toCreate.rend(); ++it) {
            if (sftp_mkdir(sftp.get(), it->c_str(), 0755) != SSH_OK) {
                BoostLogger::Error("sftp mkdir {} failed: {}", *it, ssh_get_error(s));
                return false;
            }
            BoostLogger::Debug("Created remote directory {}", *it);
        }
    }

    std::ifstream in(localPath, std::ios::binary);
    if (!in) {
        BoostLogger::Error("Cannot read {}", localPath.string());
        return false;
    }

    const auto mode = static_cast<mode_t>(localPerms & std::filesystem::perms::all);
    sftp_file file = sftp_open(sftp.get(), remotePath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
    if (!file) {
        BoostLogger::Error("sftp open {} failed: {}", remotePath, ssh_get_error(s));
        return false;
    }

    std::array<char, 32 * 1024> buf{};
    bool ok = true;
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto n = in.gcount();
        if (n <= 0) break;
        if (sftp_write(file, buf.data(), static_cast<size_t>(n)) != n) {
            BoostLogger::Error("sftp write {} failed: {}", remotePath, ssh_get_error(s));
            ok = false;
            break;
        }
    }
    if (sftp_close(file) != SSH_OK) {
        ok = false;
    }

    if (ok) {
        BoostLogger::Info("Copied {} to {}:{}", localPath.string(), endpoint(target), remotePath);
    }
    return ok;
}
