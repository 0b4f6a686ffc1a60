#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

enum class ErrorKind {
    Connection,
    NotFound,
    Key,
    Auth,
    Timeout,
    SnapshotOperation,
    InvalidDefinition,
    AgentCommand,
    Network
};

[[nodiscard]] constexpr std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Connection:        return "Connection";
        case ErrorKind::NotFound:          return "NotFound";
        case ErrorKind::Key:               return "Key";
        case ErrorKind::Auth:              return "Auth";
        case ErrorKind::Timeout:           return "Timeout";
        case ErrorKind::SnapshotOperation: return "SnapshotOperation";
        case ErrorKind::InvalidDefinition: return "InvalidDefinition";
        case ErrorKind::AgentCommand:      return "AgentCommand";
        case ErrorKind::Network:           return "Network";
    }
    return "Unknown";
}

class LabException : public std::runtime_error {
public:
    LabException(ErrorKind kind, const std::string& msg)
        : std::runtime_error("[" + std::string(toString(kind)) + "] " + msg), kind_(kind), detail_(msg) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    // الرسالة بدون البادئة
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

class ConnectionError : public LabException {
public:
    explicit ConnectionError(const std::string& msg) : LabException(ErrorKind::Connection, msg) {}
};

class NotFoundError : public LabException {
public:
    explicit NotFoundError(const std::string& msg) : LabException(ErrorKind::NotFound, msg) {}
};

class KeyError : public LabException {
public:
    explicit KeyError(const std::string& msg) : LabException(ErrorKind::Key, msg) {}
};

class AuthError : public LabException {
public:
    explicit AuthError(const std::string& msg) : LabException(ErrorKind::Auth, msg) {}
};

class TimeoutError : public LabException {
public:
    explicit TimeoutError(const std::string& msg) : LabException(ErrorKind::Timeout, msg) {}
};

class SnapshotOperationError : public LabException {
public:
    explicit SnapshotOperationError(const std::string& msg) : LabException(ErrorKind::SnapshotOperation, msg) {}
};

class InvalidDefinitionError : public LabException {
public:
    InvalidDefinitionError(std::string field, const std::string& msg)
        : LabException(ErrorKind::InvalidDefinition, field.empty() ? msg : field + ": " + msg),
          field_(std::move(field)) {}

    // اسم الحقل المسبب للخطأ (قد يكون فارغًا)
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

class AgentCommandError : public LabException {
public:
    explicit AgentCommandError(const std::string& msg) : LabException(ErrorKind::AgentCommand, msg) {}
};

class NetworkError : public LabException {
public:
    explicit NetworkError(const std::string& msg) : LabException(ErrorKind::Network, msg) {}
};
