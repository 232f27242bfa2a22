#pragma once
#include <cstdint>
#include <vector>
#include "channel/channel.hpp"

namespace enclave::channel {

// Frames are: u32 little-endian length + payload bytes
constexpr size_t kFramePrefixBytes = 4;

// Default receive limit: 64 MiB
constexpr uint32_t kDefaultMaxFrameBytes = 64u * 1024u * 1024u;

struct FrameResult {
    Status status;
    std::vector<uint8_t> payload;
};

// Write one frame. The prefix and payload go out as a single buffer so one
// call never interleaves with another writer's frame.
Status send_frame(Channel& channel, const std::vector<uint8_t>& payload);

// Read one frame. A declared length above `max_len` is a PROTOCOL_VIOLATION
// and nothing past the prefix is consumed.
FrameResult receive_frame(Channel& channel, uint32_t max_len = kDefaultMaxFrameBytes);

// Prefix helpers, exposed for peers that speak the format over raw fds
void encode_frame_prefix(uint32_t len, uint8_t out[kFramePrefixBytes]);
uint32_t decode_frame_prefix(const uint8_t in[kFramePrefixBytes]);

} // namespace enclave::channel
