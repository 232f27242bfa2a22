#include "runtime/params.hpp"
#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace enclave::runtime {

namespace {

Status require_file(const char* name, const std::filesystem::path& path) {
    if (path.empty()) {
        return Status::error(ErrorKind::CONFIGURATION, std::string(name) + " is required");
    }
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Status::error(ErrorKind::CONFIGURATION,
            std::string(name) + " does not exist: " + path.string());
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Status::error(ErrorKind::CONFIGURATION,
            std::string(name) + " does not represent a file: " + path.string());
    }
    return Status::success();
}

} // namespace

json Params::to_json() const {
    json j;
    j["vmm_binary"] = vmm_binary.string();
    j["kernel"] = kernel.string();
    j["app_binary"] = app_binary ? json(app_binary->string()) : json(nullptr);
    j["bios_binary"] = bios_binary.string();
    j["gdb"] = gdb ? json(*gdb) : json(nullptr);
    j["memory_size"] = memory_size ? json(*memory_size) : json(nullptr);
    j["initrd"] = initrd.string();
    j["pci_passthrough"] = pci_passthrough ? json(*pci_passthrough) : json(nullptr);
    j["initial_data_version"] = initial_data_version_to_string(initial_data_version);
    j["exchange_evidence"] = exchange_evidence;
    j["handshake_timeout_secs"] = handshake_timeout.count();
    j["max_frame_size"] = max_frame_size;
    j["initial_data_v1_header"] = initial_data_v1_header;
    j["guest_name"] = guest_name;
    return j;
}

ParamsResult params_from_json(const json& j, const Params& defaults) {
    ParamsResult result;
    result.params = defaults;
    Params& p = result.params;

    if (!j.is_object()) {
        result.status = Status::error(ErrorKind::CONFIGURATION, "params must be a JSON object");
        return result;
    }

    try {
        if (j.contains("vmm_binary")) p.vmm_binary = j.at("vmm_binary").get<std::string>();
        if (j.contains("kernel")) p.kernel = j.at("kernel").get<std::string>();
        if (j.contains("bios_binary")) p.bios_binary = j.at("bios_binary").get<std::string>();
        if (j.contains("initrd")) p.initrd = j.at("initrd").get<std::string>();

        if (j.contains("app_binary")) {
            const auto& v = j.at("app_binary");
            if (v.is_null()) {
                p.app_binary.reset();
            } else {
                p.app_binary = std::filesystem::path(v.get<std::string>());
            }
        }

        if (j.contains("memory_size")) {
            const auto& v = j.at("memory_size");
            if (v.is_null()) {
                p.memory_size.reset();
            } else {
                p.memory_size = v.get<std::string>();
            }
        }

        if (j.contains("pci_passthrough")) {
            const auto& v = j.at("pci_passthrough");
            if (v.is_null()) {
                p.pci_passthrough.reset();
            } else {
                p.pci_passthrough = v.get<std::string>();
            }
        }

        if (j.contains("gdb")) {
            const auto& v = j.at("gdb");
            if (v.is_null()) {
                p.gdb.reset();
            } else {
                int port = v.get<int>();
                if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
                    result.status = Status::error(ErrorKind::CONFIGURATION,
                        "gdb port out of range: " + std::to_string(port));
                    return result;
                }
                p.gdb = static_cast<uint16_t>(port);
            }
        }

        if (j.contains("initial_data_version")) {
            auto name = j.at("initial_data_version").get<std::string>();
            auto version = initial_data_version_from_string(name);
            if (!version) {
                result.status = Status::error(ErrorKind::CONFIGURATION,
                    "unknown initial_data_version: " + name);
                return result;
            }
            p.initial_data_version = *version;
        }

        if (j.contains("exchange_evidence")) {
            p.exchange_evidence = j.at("exchange_evidence").get<bool>();
        }

        if (j.contains("handshake_timeout_secs")) {
            long secs = j.at("handshake_timeout_secs").get<long>();
            if (secs <= 0) {
                result.status = Status::error(ErrorKind::CONFIGURATION,
                    "handshake_timeout_secs must be positive");
                return result;
            }
            p.handshake_timeout = std::chrono::seconds(secs);
        }

        if (j.contains("max_frame_size")) {
            int64_t size = j.at("max_frame_size").get<int64_t>();
            if (size <= 0 || size > std::numeric_limits<uint32_t>::max()) {
                result.status = Status::error(ErrorKind::CONFIGURATION,
                    "max_frame_size out of range: " + std::to_string(size));
                return result;
            }
            p.max_frame_size = static_cast<uint32_t>(size);
        }

        if (j.contains("initial_data_v1_header")) {
            p.initial_data_v1_header = j.at("initial_data_v1_header").get<std::string>();
        }

        if (j.contains("guest_name")) {
            p.guest_name = j.at("guest_name").get<std::string>();
        }
    } catch (const json::exception& e) {
        result.status = Status::error(ErrorKind::CONFIGURATION,
            std::string("invalid params: ") + e.what());
    }

    return result;
}

ParamsResult load_params_file(const std::filesystem::path& path, const Params& defaults) {
    std::ifstream file(path);
    if (!file) {
        ParamsResult result;
        result.params = defaults;
        result.status = Status::error(ErrorKind::CONFIGURATION,
            "cannot open params file: " + path.string());
        return result;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& e) {
        ParamsResult result;
        result.params = defaults;
        result.status = Status::error(ErrorKind::CONFIGURATION,
            "failed to parse " + path.string() + ": " + e.what());
        return result;
    }

    return params_from_json(j, defaults);
}

Status validate_params(const Params& params) {
    Status status = require_file("vmm_binary", params.vmm_binary);
    if (!status.ok()) return status;

    status = require_file("kernel", params.kernel);
    if (!status.ok()) return status;

    status = require_file("bios_binary", params.bios_binary);
    if (!status.ok()) return status;

    status = require_file("initrd", params.initrd);
    if (!status.ok()) return status;

    if (params.app_binary) {
        status = require_file("app_binary", *params.app_binary);
        if (!status.ok()) return status;
    }

    if (params.gdb && *params.gdb == 0) {
        return Status::error(ErrorKind::CONFIGURATION, "gdb port must be non-zero");
    }
    if (params.max_frame_size == 0) {
        return Status::error(ErrorKind::CONFIGURATION, "max_frame_size must be non-zero");
    }
    if (params.handshake_timeout.count() <= 0) {
        return Status::error(ErrorKind::CONFIGURATION, "handshake timeout must be positive");
    }
    if (params.initial_data_version == InitialDataVersion::V1 &&
        params.initial_data_v1_header.empty()) {
        return Status::error(ErrorKind::CONFIGURATION, "initial_data_v1_header must not be empty");
    }

    return Status::success();
}

} // namespace enclave::runtime
