#include "core/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>

namespace enclave::core {

namespace {
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
}

void init_logger() {
    auto logger = spdlog::get("enclave");
    if (!logger) {
        logger = spdlog::stderr_color_mt("enclave");
    }
    logger->set_pattern(kPattern);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum log_level_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_guest_logger(const std::string& guest_name) {
    auto base = spdlog::default_logger();
    auto logger = std::make_shared<spdlog::logger>(
        guest_name, base->sinks().begin(), base->sinks().end());
    logger->set_level(base->level());
    // Console output is best effort; a failing sink must not reach the guest.
    logger->set_error_handler([](const std::string&) {});
    return logger;
}

} // namespace enclave::core
