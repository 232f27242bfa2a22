#pragma once
#include <cstdint>
#include <memory>
#include <vector>
#include "channel/connector.hpp"
#include "core/status.hpp"
#include "runtime/console_forwarder.hpp"
#include "runtime/guest_instance.hpp"
#include "runtime/params.hpp"

namespace enclave::runtime {

// Host side of a running guest. Destruction order: connector, instance,
// console.
struct LaunchResult {
    Status status;
    std::unique_ptr<ConsoleForwarder> console;
    std::unique_ptr<GuestInstance> instance;
    channel::ConnectorHandle connector;
    std::vector<uint8_t> evidence;
};

/**
 * Launch a guest VM: wire up the console, start the monitor, run the
 * bootstrap and bridge the data channel to a connector.
 *
 * On failure everything created so far is torn down before returning.
 */
LaunchResult launch(const Params& params);

} // namespace enclave::runtime
