#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/status.hpp"

namespace enclave::runtime {

// Bootstrap payload layout expected by the guest image
enum class InitialDataVersion {
    V0,  // Raw application bytes
    V1   // Header followed by a serialized InitialData message
};

const char* initial_data_version_to_string(InitialDataVersion version);

// Accepts "v0"/"v1" in any case.
std::optional<InitialDataVersion> initial_data_version_from_string(const std::string& str);

// Magic prefix of a V1 payload. Has to match the guest image; launch
// parameters can override it.
inline constexpr const char* kInitialDataV1Header = "INITIAL_DATA_V1";

struct InitialDataResult {
    Status status;
    std::vector<uint8_t> bytes;
};

// Build the bootstrap payload for `version`. Endorsements are delivered out
// of band, so a V1 payload always carries empty endorsement bytes.
InitialDataResult build_initial_data(InitialDataVersion version,
                                     const std::vector<uint8_t>& application_bytes,
                                     const std::string& v1_header = kInitialDataV1Header);

struct DecodedInitialData {
    Status status;
    std::vector<uint8_t> application_bytes;
    std::vector<uint8_t> endorsement_bytes;
};

// Inverse of build_initial_data for V1 payloads. PROTOCOL_VIOLATION when the
// header is missing or the message does not parse.
DecodedInitialData decode_initial_data_v1(const std::vector<uint8_t>& payload,
                                          const std::string& v1_header = kInitialDataV1Header);

} // namespace enclave::runtime
