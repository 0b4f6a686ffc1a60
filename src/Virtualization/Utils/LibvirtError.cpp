#include "Virtualization/Utils/LibvirtError.hpp"
#include <fmt/format.h>

std::string LibvirtErrorCategory::message(int condition) const {
    switch (condition) {
        case VIR_ERR_OK:                  return "no error";
        case VIR_ERR_NO_CONNECT:          return "no connection driver available";
        case VIR_ERR_NO_DOMAIN:           return "domain not found";
        case VIR_ERR_NO_DOMAIN_SNAPSHOT:  return "domain snapshot not found";
        case VIR_ERR_OPERATION_INVALID:   return "operation not valid in the current state";
        case VIR_ERR_CONFIG_EXIST:        return "object already exists";
        case VIR_ERR_AGENT_UNRESPONSIVE:  return "guest agent is not responding";
        case VIR_ERR_AGENT_UNSYNCED:      return "guest agent replied with wrong id";
        case VIR_ERR_OPERATION_TIMEOUT:   return "operation timed out";
        case VIR_ERR_NO_SUPPORT:          return "operation not supported by the driver";
        default:                          return fmt::format("libvirt error {}", condition);
    }
}

const std::error_category& libvirt_category() noexcept {
    static LibvirtErrorCategory category;
    return category;
}

LibvirtError LibvirtError::last() {
    LibvirtError err;
    virErrorPtr e = virGetLastError();
    if (e) {
        err.code = e->code;
        err.message = e->message ? e->message : libvirt_category().message(e->code);
    } else {
        err.message = "unknown libvirt error";
    }
    return err;
}

void throwLabException(ErrorKind kind, const std::string& msg) {
    switch (kind) {
        case ErrorKind::Connection:        throw ConnectionError(msg);
        case ErrorKind::NotFound:          throw NotFoundError(msg);
        case ErrorKind::Key:               throw KeyError(msg);
        case ErrorKind::Auth:              throw AuthError(msg);
        case ErrorKind::Timeout:           throw TimeoutError(msg);
        case ErrorKind::SnapshotOperation: throw SnapshotOperationError(msg);
        case ErrorKind::InvalidDefinition: throw InvalidDefinitionError("", msg);
        case ErrorKind::AgentCommand:      throw AgentCommandError(msg);
        case ErrorKind::Network:           throw NetworkError(msg);
    }
    throw LabException(kind, msg);
}

void throwLibvirtError(const std::string& action, ErrorKind fallback) {
    const auto err = LibvirtError::last();
    const auto msg = fmt::format("{}: {}", action, err.message);

    switch (err.code) {
        case VIR_ERR_NO_DOMAIN:
        case VIR_ERR_NO_DOMAIN_SNAPSHOT:
            throw NotFoundError(msg);
        case VIR_ERR_AGENT_UNRESPONSIVE:
        case VIR_ERR_AGENT_UNSYNCED:
            throw AgentCommandError(msg);
        case VIR_ERR_NO_CONNECT:
        case VIR_ERR_RPC:
            throw ConnectionError(msg);
        case VIR_ERR_OPERATION_TIMEOUT:
            throw TimeoutError(msg);
        default:
            throwLabException(fallback, msg);
    }
}
