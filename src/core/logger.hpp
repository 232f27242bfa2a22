#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace enclave::core {

// Initialize logging with console output
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
// Unknown names fall back to info.
spdlog::level::level_enum log_level_from_string(const std::string& name);

// Logger used to tag guest console output. Shares the default logger's sinks
// and never reports sink failures.
std::shared_ptr<spdlog::logger> make_guest_logger(const std::string& guest_name);

} // namespace enclave::core
