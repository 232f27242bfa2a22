#pragma once
#include <chrono>
#include <cstdint>
#include <vector>
#include "channel/channel.hpp"
#include "channel/framed.hpp"

namespace enclave::runtime {

// Bootstrap handshake progress
enum class BootstrapState {
    IDLE,
    PAYLOAD_SENT,
    EVIDENCE_AWAITED,
    COMPLETE,
    FAILED
};

const char* bootstrap_state_to_string(BootstrapState state);

struct BootstrapOptions {
    std::chrono::milliseconds timeout{30000};  // Bounds the whole exchange
    bool exchange_evidence = false;
    uint32_t max_frame_size = channel::kDefaultMaxFrameBytes;
};

struct BootstrapResult {
    Status status;
    BootstrapState state = BootstrapState::IDLE;  // COMPLETE or FAILED
    std::vector<uint8_t> evidence;                // Opaque attestation evidence
};

/**
 * Deliver the initial data to a freshly started guest.
 *
 * Sends `initial_data` as one frame and, with `exchange_evidence`, reads one
 * frame of attestation evidence back. Both steps share a single deadline of
 * `options.timeout`; a guest that stays silent fails with HANDSHAKE_TIMEOUT.
 * The deadline is removed from `channel` before returning, whatever the
 * outcome. The caller must hold the only handle onto the data socket.
 */
BootstrapResult run_bootstrap(channel::Channel& channel,
                              const std::vector<uint8_t>& initial_data,
                              const BootstrapOptions& options);

} // namespace enclave::runtime
