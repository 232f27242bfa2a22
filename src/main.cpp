/**
 * enclave_launcher
 *
 * Starts a guest VM, delivers its application through the bootstrap
 * handshake and forwards its console until the guest exits or the launcher
 * is interrupted.
 */
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <signal.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/config.hpp"
#include "core/logger.hpp"
#include "runtime/launcher.hpp"
#include "runtime/params.hpp"

using json = nlohmann::json;
using namespace enclave;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitLaunchError = 1;
constexpr int kExitUsage = 2;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_signal(int) {
    g_shutdown_requested = 1;
}

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    for (int sig : {SIGINT, SIGTERM}) {
        if (sigaction(sig, &sa, nullptr) < 0) {
            spdlog::warn("Failed to install handler for signal {}", sig);
        }
    }
}

void print_usage(const char* argv0) {
    std::cout
        << "Usage: " << argv0 << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  --vmm-binary PATH            Guest monitor (QEMU) executable\n"
        << "  --kernel PATH                Enclave kernel image\n"
        << "  --app-binary PATH            Application delivered through the bootstrap\n"
        << "  --bios-binary PATH           Firmware image\n"
        << "  --gdb PORT                   Wait for a debugger on this port\n"
        << "  --memory-size SIZE           Guest memory, e.g. 256M or 2G\n"
        << "  --initrd PATH                Initial ramdisk\n"
        << "  --pci-passthrough ADDR       Host PCI device passed through with VFIO\n"
        << "  --initial-data-version V     v0 (raw) or v1 (header + InitialData)\n"
        << "  --exchange-evidence          Wait for attestation evidence after the payload\n"
        << "  --handshake-timeout SECS     Bootstrap timeout (default 30)\n"
        << "  --guest-name NAME            Name console output is logged under\n"
        << "  --config FILE                JSON params file; flags override its values\n"
        << "  --log-level LEVEL            trace, debug, info, warn, error, critical, off\n"
        << "  --help                       Show this help\n"
        << "\n"
        << "Environment:\n"
        << "  " << core::config::kEnvLogLevel << ", "
        << core::config::kEnvHandshakeTimeoutSecs << ", "
        << core::config::kEnvConfig << "\n";
}

struct CliOptions {
    json overrides = json::object();  // Params keys set on the command line
    std::string config_path;
    std::string log_level;
    bool help = false;
};

bool parse_number(const std::string& text, long& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = value;
    return true;
}

// Returns an error message, empty on success.
std::string parse_cli(int argc, char** argv, CliOptions& cli) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        bool has_inline_value = false;

        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            has_inline_value = true;
        }

        auto take_value = [&](std::string& out) -> bool {
            if (has_inline_value) {
                out = value;
                return true;
            }
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            cli.help = true;
            continue;
        }
        if (arg == "--exchange-evidence") {
            cli.overrides["exchange_evidence"] = true;
            continue;
        }

        std::string v;
        if (arg == "--vmm-binary" || arg == "--kernel" || arg == "--app-binary" ||
            arg == "--bios-binary" || arg == "--memory-size" || arg == "--initrd" ||
            arg == "--pci-passthrough" || arg == "--initial-data-version" ||
            arg == "--guest-name") {
            if (!take_value(v)) return arg + " requires a value";
            std::string key = arg.substr(2);
            for (auto& c : key) {
                if (c == '-') c = '_';
            }
            cli.overrides[key] = v;
        } else if (arg == "--gdb") {
            long port = 0;
            if (!take_value(v)) return arg + " requires a value";
            if (!parse_number(v, port)) return "invalid gdb port: " + v;
            cli.overrides["gdb"] = port;
        } else if (arg == "--handshake-timeout") {
            long secs = 0;
            if (!take_value(v)) return arg + " requires a value";
            if (!parse_number(v, secs)) return "invalid handshake timeout: " + v;
            cli.overrides["handshake_timeout_secs"] = secs;
        } else if (arg == "--config") {
            if (!take_value(cli.config_path)) return arg + " requires a value";
        } else if (arg == "--log-level") {
            if (!take_value(cli.log_level)) return arg + " requires a value";
        } else {
            return "unknown option: " + arg;
        }
    }
    return "";
}

} // namespace

int main(int argc, char** argv) {
    core::config::load_dotenv();
    core::init_logger();

    CliOptions cli;
    std::string error = parse_cli(argc, argv, cli);
    if (!error.empty()) {
        std::cerr << "error: " << error << "\n\n";
        print_usage(argv[0]);
        return kExitUsage;
    }
    if (cli.help) {
        print_usage(argv[0]);
        return kExitOk;
    }

    std::string level = cli.log_level.empty()
        ? core::config::get_env_or(core::config::kEnvLogLevel, "info")
        : cli.log_level;
    core::set_log_level(core::log_level_from_string(level));

    // Defaults, then environment, then the params file, then flags
    runtime::Params params;
    long env_timeout = core::config::get_env_int_or(core::config::kEnvHandshakeTimeoutSecs, 0);
    if (env_timeout > 0) {
        params.handshake_timeout = std::chrono::seconds(env_timeout);
    }

    std::string config_path = cli.config_path.empty()
        ? core::config::get_env(core::config::kEnvConfig)
        : cli.config_path;
    if (!config_path.empty()) {
        runtime::ParamsResult loaded = runtime::load_params_file(config_path, params);
        if (!loaded.status.ok()) {
            spdlog::error("{}", loaded.status.to_string());
            return kExitUsage;
        }
        params = loaded.params;
        spdlog::debug("Loaded params from {}", config_path);
    }

    runtime::ParamsResult merged = runtime::params_from_json(cli.overrides, params);
    if (!merged.status.ok()) {
        spdlog::error("{}", merged.status.to_string());
        return kExitUsage;
    }
    params = merged.params;

    Status valid = runtime::validate_params(params);
    if (!valid.ok()) {
        spdlog::error("{}", valid.to_string());
        return kExitUsage;
    }
    spdlog::debug("Launch params: {}", params.to_json().dump());

    install_signal_handlers();

    runtime::LaunchResult launched = runtime::launch(params);
    if (!launched.status.ok()) {
        spdlog::error("Launch failed: {}", launched.status.to_string());
        return kExitLaunchError;
    }
    if (!launched.evidence.empty()) {
        spdlog::info("Attestation evidence: {} bytes", launched.evidence.size());
    }
    spdlog::info("Guest '{}' running (pid={})", params.guest_name, launched.instance->pid());

    runtime::ExitStatus exit_status;
    bool exited = false;
    while (!g_shutdown_requested) {
        if (launched.instance->try_wait(exit_status)) {
            exited = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (!exited) {
        spdlog::info("Shutdown requested");
    }

    launched.connector.close();
    runtime::WaitResult killed = runtime::GuestInstance::kill(std::move(launched.instance));
    launched.console->stop();

    if (!killed.status.ok()) {
        spdlog::error("Failed to stop guest: {}", killed.status.to_string());
        return kExitLaunchError;
    }
    spdlog::info("Guest ended with {}", killed.exit.to_string());

    if (!exited) {
        return kExitOk;
    }
    return exit_status.success() ? kExitOk : kExitLaunchError;
}
