#include "core/status.hpp"
#include <cstring>

namespace enclave {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:               return "NONE";
        case ErrorKind::CONFIGURATION:      return "CONFIGURATION";
        case ErrorKind::SPAWN:              return "SPAWN";
        case ErrorKind::PROTOCOL_VIOLATION: return "PROTOCOL_VIOLATION";
        case ErrorKind::HANDSHAKE_TIMEOUT:  return "HANDSHAKE_TIMEOUT";
        case ErrorKind::CONNECTION_CLOSED:  return "CONNECTION_CLOSED";
        case ErrorKind::TIMED_OUT:          return "TIMED_OUT";
        case ErrorKind::IO:                 return "IO";
        default: return "UNKNOWN";
    }
}

std::string Status::to_string() const {
    if (ok()) {
        return "OK";
    }
    std::string out = error_kind_to_string(kind);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

Status Status::error(ErrorKind kind, std::string message) {
    Status status;
    status.kind = kind;
    status.message = std::move(message);
    return status;
}

Status Status::from_errno(const std::string& what, int err) {
    return error(ErrorKind::IO, what + ": " + std::strerror(err));
}

} // namespace enclave
