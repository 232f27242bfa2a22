#include "channel/framed.hpp"
#include <algorithm>
#include <limits>
#include <string>

namespace enclave::channel {

void encode_frame_prefix(uint32_t len, uint8_t out[kFramePrefixBytes]) {
    out[0] = static_cast<uint8_t>(len & 0xFF);
    out[1] = static_cast<uint8_t>((len >> 8) & 0xFF);
    out[2] = static_cast<uint8_t>((len >> 16) & 0xFF);
    out[3] = static_cast<uint8_t>((len >> 24) & 0xFF);
}

uint32_t decode_frame_prefix(const uint8_t in[kFramePrefixBytes]) {
    return static_cast<uint32_t>(in[0])
        | (static_cast<uint32_t>(in[1]) << 8)
        | (static_cast<uint32_t>(in[2]) << 16)
        | (static_cast<uint32_t>(in[3]) << 24);
}

Status send_frame(Channel& channel, const std::vector<uint8_t>& payload) {
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        return Status::error(ErrorKind::PROTOCOL_VIOLATION,
            "frame of " + std::to_string(payload.size()) + " bytes does not fit a u32 prefix");
    }

    std::vector<uint8_t> buffer(kFramePrefixBytes + payload.size());
    encode_frame_prefix(static_cast<uint32_t>(payload.size()), buffer.data());
    std::copy(payload.begin(), payload.end(), buffer.begin() + kFramePrefixBytes);

    return channel.write_all(buffer.data(), buffer.size());
}

FrameResult receive_frame(Channel& channel, uint32_t max_len) {
    FrameResult result;

    uint8_t prefix[kFramePrefixBytes];
    result.status = channel.read_exact(prefix, sizeof(prefix));
    if (!result.status.ok()) {
        return result;
    }

    uint32_t len = decode_frame_prefix(prefix);
    if (len > max_len) {
        result.status = Status::error(ErrorKind::PROTOCOL_VIOLATION,
            "frame declares " + std::to_string(len) + " bytes, limit is " + std::to_string(max_len));
        return result;
    }

    result.payload.resize(len);
    if (len > 0) {
        result.status = channel.read_exact(result.payload.data(), len);
        if (!result.status.ok()) {
            result.payload.clear();
        }
    }
    return result;
}

} // namespace enclave::channel
