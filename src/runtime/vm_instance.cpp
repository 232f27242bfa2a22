#include "runtime/vm_instance.hpp"
#include "runtime/bootstrap.hpp"
#include "runtime/initial_data.hpp"
#include "runtime/vmm_args.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sys/socket.h>

namespace enclave::runtime {

namespace {

Status read_file_bytes(const std::filesystem::path& path, std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Status::error(ErrorKind::CONFIGURATION,
            "couldn't read application binary " + path.string());
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Status::error(ErrorKind::CONFIGURATION,
            "error while reading application binary " + path.string());
    }
    return Status::success();
}

} // namespace

VmInstance::VmInstance(Token,
                       core::UniqueFd guest_console,
                       std::unique_ptr<channel::UnixChannel> host_socket,
                       std::unique_ptr<ChildProcess> process)
    : guest_console_(std::move(guest_console))
    , host_socket_(std::move(host_socket))
    , process_(std::move(process)) {}

VmInstance::~VmInstance() {
    if (!armed_.exchange(false)) {
        return;
    }

    spdlog::warn("Guest instance (pid={}) dropped without kill; terminating it", pid());
    if (guest_console_.valid() && ::shutdown(guest_console_.get(), SHUT_RDWR) < 0 && errno != ENOTCONN) {
        spdlog::debug("Console shutdown: {}", std::strerror(errno));
    }
    Status status = process_->start_kill();
    if (!status.ok()) {
        spdlog::error("Failed to kill guest instance: {}", status.to_string());
    }
    WaitResult result = process_->wait();
    if (result.status.ok()) {
        spdlog::debug("Dropped guest instance ended with {}", result.exit.to_string());
    }
}

StartResult VmInstance::start(const Params& params, core::UniqueFd guest_console) {
    StartResult result;

    std::optional<std::vector<uint8_t>> app_bytes;
    if (params.app_binary) {
        std::vector<uint8_t> bytes;
        result.status = read_file_bytes(*params.app_binary, bytes);
        if (!result.status.ok()) {
            return result;
        }
        spdlog::info("Read application binary from disk {} ({} bytes)",
            params.app_binary->string(), bytes.size());
        app_bytes = std::move(bytes);
    }

    core::UniqueFd guest_socket;
    core::UniqueFd host_socket;
    result.status = channel::make_socket_pair(guest_socket, host_socket);
    if (!result.status.ok()) {
        return result;
    }

    // One copy of the console goes to the child, the other stays here so
    // kill() can shut it down.
    core::UniqueFd console_copy;
    result.status = channel::duplicate_fd(guest_console.get(), console_copy);
    if (!result.status.ok()) {
        return result;
    }

    SpawnOptions options;
    options.program = params.vmm_binary.string();
    options.args = build_vmm_args(params, guest_console.get(), guest_socket.get());
    options.preserved_fds = {guest_console.get(), guest_socket.get()};
    options.kill_on_drop = true;

    spdlog::info("Executing: {}", format_command(options.program, options.args));

    SpawnResult spawned = ChildProcess::spawn(options);
    if (!spawned.status.ok()) {
        result.status = spawned.status;
        return result;
    }

    // The child has its own copies now.
    guest_console.reset();
    guest_socket.reset();

    auto instance = std::make_unique<VmInstance>(
        Token{},
        std::move(console_copy),
        std::make_unique<channel::UnixChannel>(std::move(host_socket)),
        std::move(spawned.process));
    spdlog::info("Guest instance started (pid={})", instance->pid());

    if (app_bytes) {
        InitialDataResult initial_data = build_initial_data(
            params.initial_data_version, *app_bytes, params.initial_data_v1_header);
        if (!initial_data.status.ok()) {
            WaitResult killed = instance->do_kill();
            if (!killed.status.ok()) {
                spdlog::error("Failed to kill guest instance: {}", killed.status.to_string());
            }
            result.status = initial_data.status;
            return result;
        }

        BootstrapOptions bootstrap;
        bootstrap.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(params.handshake_timeout);
        bootstrap.exchange_evidence = params.exchange_evidence;
        bootstrap.max_frame_size = params.max_frame_size;

        BootstrapResult handshake = run_bootstrap(*instance->host_socket_, initial_data.bytes, bootstrap);
        if (!handshake.status.ok()) {
            spdlog::error("Bootstrap failed: {}", handshake.status.to_string());
            WaitResult killed = instance->do_kill();
            if (killed.status.ok()) {
                spdlog::info("Guest instance ended with {}", killed.exit.to_string());
            }
            result.status = handshake.status;
            return result;
        }
        spdlog::info("Initial data delivered ({}, {} bytes)",
            initial_data_version_to_string(params.initial_data_version), initial_data.bytes.size());
        result.evidence = std::move(handshake.evidence);
    }

    result.instance = std::move(instance);
    return result;
}

WaitResult VmInstance::wait() {
    spdlog::info("Waiting for guest instance to terminate");
    return process_->wait();
}

bool VmInstance::try_wait(ExitStatus& out) {
    return process_->try_wait(out);
}

WaitResult VmInstance::do_kill() {
    armed_.store(false);
    spdlog::info("Killing guest instance; cleaning up and shutting down");

    if (guest_console_.valid() && ::shutdown(guest_console_.get(), SHUT_RDWR) < 0 && errno != ENOTCONN) {
        spdlog::debug("Console shutdown: {}", std::strerror(errno));
    }

    WaitResult result;
    result.status = process_->start_kill();
    if (!result.status.ok()) {
        return result;
    }
    return process_->wait();
}

channel::ChannelResult VmInstance::connect() {
    spdlog::info("Connecting to guest instance");
    return host_socket_->try_clone();
}

pid_t VmInstance::pid() const {
    return process_->pid();
}

} // namespace enclave::runtime
