#include "runtime/initial_data.hpp"
#include "initial_data.pb.h"
#include <algorithm>
#include <cctype>

namespace enclave::runtime {

const char* initial_data_version_to_string(InitialDataVersion version) {
    switch (version) {
        case InitialDataVersion::V0: return "v0";
        case InitialDataVersion::V1: return "v1";
        default: return "unknown";
    }
}

std::optional<InitialDataVersion> initial_data_version_from_string(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "v0") return InitialDataVersion::V0;
    if (lower == "v1") return InitialDataVersion::V1;
    return std::nullopt;
}

InitialDataResult build_initial_data(InitialDataVersion version,
                                     const std::vector<uint8_t>& application_bytes,
                                     const std::string& v1_header) {
    InitialDataResult result;

    if (version == InitialDataVersion::V0) {
        result.bytes = application_bytes;
        return result;
    }

    ::enclave::bootstrap::InitialData message;
    message.set_application_bytes(application_bytes.data(), application_bytes.size());
    message.set_endorsement_bytes(std::string());

    std::string serialized;
    if (!message.SerializeToString(&serialized)) {
        result.status = Status::error(ErrorKind::PROTOCOL_VIOLATION,
            "failed to serialize initial data");
        return result;
    }

    result.bytes.reserve(v1_header.size() + serialized.size());
    result.bytes.insert(result.bytes.end(), v1_header.begin(), v1_header.end());
    result.bytes.insert(result.bytes.end(), serialized.begin(), serialized.end());
    return result;
}

DecodedInitialData decode_initial_data_v1(const std::vector<uint8_t>& payload,
                                          const std::string& v1_header) {
    DecodedInitialData decoded;

    if (payload.size() < v1_header.size() ||
        !std::equal(v1_header.begin(), v1_header.end(), payload.begin())) {
        decoded.status = Status::error(ErrorKind::PROTOCOL_VIOLATION,
            "initial data does not start with the V1 header");
        return decoded;
    }

    ::enclave::bootstrap::InitialData message;
    const uint8_t* body = payload.data() + v1_header.size();
    size_t body_len = payload.size() - v1_header.size();
    if (!message.ParseFromArray(body, static_cast<int>(body_len))) {
        decoded.status = Status::error(ErrorKind::PROTOCOL_VIOLATION,
            "malformed initial data message");
        return decoded;
    }

    decoded.application_bytes.assign(message.application_bytes().begin(),
                                     message.application_bytes().end());
    decoded.endorsement_bytes.assign(message.endorsement_bytes().begin(),
                                     message.endorsement_bytes().end());
    return decoded;
}

} // namespace enclave::runtime
