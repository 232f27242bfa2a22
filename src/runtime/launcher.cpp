#include "runtime/launcher.hpp"
#include "channel/channel.hpp"
#include "core/logger.hpp"
#include "runtime/vm_instance.hpp"
#include <spdlog/spdlog.h>

namespace enclave::runtime {

LaunchResult launch(const Params& params) {
    LaunchResult result;

    core::UniqueFd console_writer;
    core::UniqueFd console_reader;
    result.status = channel::make_socket_pair(console_writer, console_reader);
    if (!result.status.ok()) {
        return result;
    }

    auto console = std::make_unique<ConsoleForwarder>(
        std::move(console_reader), core::make_guest_logger(params.guest_name));
    console->start();

    StartResult started = VmInstance::start(params, std::move(console_writer));
    if (!started.status.ok()) {
        spdlog::error("Failed to start guest instance: {}", started.status.to_string());
        console->stop();
        result.status = started.status;
        return result;
    }
    std::unique_ptr<GuestInstance> instance = std::move(started.instance);

    channel::ChannelResult connected = instance->connect();
    if (!connected.status.ok()) {
        spdlog::error("Failed to connect to guest instance: {}", connected.status.to_string());
        WaitResult killed = GuestInstance::kill(std::move(instance));
        if (!killed.status.ok()) {
            spdlog::error("Failed to kill guest instance: {}", killed.status.to_string());
        }
        console->stop();
        result.status = connected.status;
        return result;
    }

    result.connector = channel::Connector::spawn(std::move(connected.channel), params.max_frame_size);
    result.console = std::move(console);
    result.instance = std::move(instance);
    result.evidence = std::move(started.evidence);
    return result;
}

} // namespace enclave::runtime
