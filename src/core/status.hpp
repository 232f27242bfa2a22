#pragma once
#include <string>

namespace enclave {

// Failure classes reported by launcher operations
enum class ErrorKind {
    NONE,
    CONFIGURATION,       // Invalid or missing launch parameters
    SPAWN,               // Guest monitor process could not be created
    PROTOCOL_VIOLATION,  // Oversized frame or malformed envelope
    HANDSHAKE_TIMEOUT,   // Guest did not answer the bootstrap in time
    CONNECTION_CLOSED,   // Peer closed the stream mid-read
    TIMED_OUT,           // A bounded read or write ran out of time
    IO                   // Any other operating system error
};

const char* error_kind_to_string(ErrorKind kind);

// Outcome of an operation; `kind == NONE` means success.
struct Status {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;

    bool ok() const { return kind == ErrorKind::NONE; }

    // "HANDSHAKE_TIMEOUT: no evidence within 30s"
    std::string to_string() const;

    static Status success() { return Status{}; }
    static Status error(ErrorKind kind, std::string message);
    // IO status from errno, prefixed with `what`
    static Status from_errno(const std::string& what, int err);
};

} // namespace enclave
