#pragma once
#include <optional>
#include <string>
#include <string_view>

struct SshTarget {
    std::string host;
    std::string user;
    std::string keyPath;
    int port{22};
};

enum class SshFailureKind { Auth, Network, Timeout, Protocol };

[[nodiscard]] constexpr std::string_view toString(SshFailureKind kind) noexcept {
    switch (kind) {
        case SshFailureKind::Auth:     return "auth";
        case SshFailureKind::Network:  return "network";
        case SshFailureKind::Timeout:  return "timeout";
        case SshFailureKind::Protocol: return "protocol";
    }
    return "protocol";
}

struct SshFailure {
    SshFailureKind kind{SshFailureKind::Protocol};
    std::string message;
};

/**
 * @brief Outcome of one remote command.
 *
 * Exactly one of exitCode and error is set.
 */
struct CommandResult {
    std::string stdoutText;
    std::string stderrText;
    std::optional<int> exitCode;
    std::optional<SshFailure> error;

    [[nodiscard]] bool succeeded() const noexcept { return !error && exitCode == 0; }

    [[nodiscard]] static CommandResult fromExit(int code, std::string out, std::string err) {
        CommandResult r;
        r.exitCode = code;
        r.stdoutText = std::move(out);
        r.stderrText = std::move(err);
        return r;
    }

    [[nodiscard]] static CommandResult fromFailure(SshFailureKind kind, std::string message) {
        CommandResult r;
        r.error = SshFailure{kind, std::move(message)};
        return r;
    }
};
