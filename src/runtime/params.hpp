#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "channel/framed.hpp"
#include "core/status.hpp"
#include "runtime/initial_data.hpp"

namespace enclave::runtime {

// Parameters for launching a guest VM instance
struct Params {
    std::filesystem::path vmm_binary;                  // Guest monitor (QEMU) executable
    std::filesystem::path kernel;                      // Enclave kernel image
    std::optional<std::filesystem::path> app_binary;   // Application loaded through the bootstrap
    std::filesystem::path bios_binary;                 // Firmware image
    std::optional<uint16_t> gdb;                       // Wait for a debugger on this port
    std::optional<std::string> memory_size;            // e.g. "256M", "2G"
    std::filesystem::path initrd;                      // Initial ramdisk
    std::optional<std::string> pci_passthrough;        // Host PCI address passed through with VFIO
    InitialDataVersion initial_data_version = InitialDataVersion::V0;

    // Bootstrap behaviour
    bool exchange_evidence = false;                    // Wait for attestation evidence after the payload
    std::chrono::seconds handshake_timeout{30};
    uint32_t max_frame_size = channel::kDefaultMaxFrameBytes;
    std::string initial_data_v1_header = kInitialDataV1Header;

    // Name console output is logged under
    std::string guest_name = "guest";

    nlohmann::json to_json() const;
};

struct ParamsResult {
    Status status;
    Params params;
};

/**
 * Build params from a JSON object. Keys match the Params field names, with
 * "handshake_timeout_secs" for the timeout. Missing keys keep the values
 * of `defaults`.
 */
ParamsResult params_from_json(const nlohmann::json& j, const Params& defaults = Params{});

// Read and parse a JSON params file
ParamsResult load_params_file(const std::filesystem::path& path, const Params& defaults = Params{});

// Check that every referenced file exists and the tunables are usable
Status validate_params(const Params& params);

} // namespace enclave::runtime
