#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace enclave::core::config {

// Environment variables understood by the launcher.
inline constexpr const char* kEnvLogLevel = "ENCLAVE_LOG_LEVEL";
inline constexpr const char* kEnvHandshakeTimeoutSecs = "ENCLAVE_HANDSHAKE_TIMEOUT_SECS";
inline constexpr const char* kEnvConfig = "ENCLAVE_CONFIG";

// Split a .env line into key and value. False for blanks, comments and
// lines without '='.
bool parse_dotenv_line(const std::string& line, std::string& key, std::string& value);

// Load environment variables from a .env file (idempotent).
// Variables that are already set are never overridden.
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Get an integer environment variable; fallback when unset or not a number.
long get_env_int_or(const std::string& key, long fallback);

} // namespace enclave::core::config
