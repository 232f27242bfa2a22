#include "runtime/bootstrap.hpp"
#include <spdlog/spdlog.h>

namespace enclave::runtime {

namespace {

// Timeouts during the bootstrap are reported as handshake failures.
Status as_handshake_error(Status status, const char* step) {
    if (status.kind == ErrorKind::TIMED_OUT) {
        status.kind = ErrorKind::HANDSHAKE_TIMEOUT;
    }
    status.message = std::string(step) + ": " + status.message;
    return status;
}

} // namespace

const char* bootstrap_state_to_string(BootstrapState state) {
    switch (state) {
        case BootstrapState::IDLE:             return "IDLE";
        case BootstrapState::PAYLOAD_SENT:     return "PAYLOAD_SENT";
        case BootstrapState::EVIDENCE_AWAITED: return "EVIDENCE_AWAITED";
        case BootstrapState::COMPLETE:         return "COMPLETE";
        case BootstrapState::FAILED:           return "FAILED";
        default: return "UNKNOWN";
    }
}

BootstrapResult run_bootstrap(channel::Channel& channel,
                              const std::vector<uint8_t>& initial_data,
                              const BootstrapOptions& options) {
    BootstrapResult result;

    // The exchange is synchronous; without a deadline a guest monitor that
    // died or hung would block us forever.
    channel.set_io_deadline(std::chrono::steady_clock::now() + options.timeout);

    Status status = channel::send_frame(channel, initial_data);
    if (!status.ok()) {
        channel.set_io_deadline(std::nullopt);
        result.status = as_handshake_error(status, "failed to send initial data");
        result.state = BootstrapState::FAILED;
        return result;
    }
    result.state = BootstrapState::PAYLOAD_SENT;
    spdlog::debug("Initial data sent ({} bytes)", initial_data.size());

    if (options.exchange_evidence) {
        result.state = BootstrapState::EVIDENCE_AWAITED;
        channel::FrameResult frame = channel::receive_frame(channel, options.max_frame_size);
        if (!frame.status.ok()) {
            channel.set_io_deadline(std::nullopt);
            result.status = as_handshake_error(frame.status, "failed to receive attestation evidence");
            result.state = BootstrapState::FAILED;
            return result;
        }
        result.evidence = std::move(frame.payload);
        spdlog::info("Received attestation evidence ({} bytes)", result.evidence.size());
    }

    channel.set_io_deadline(std::nullopt);
    result.state = BootstrapState::COMPLETE;
    return result;
}

} // namespace enclave::runtime
