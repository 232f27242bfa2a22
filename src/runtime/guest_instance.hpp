#pragma once
#include <memory>
#include <sys/types.h>
#include "channel/channel.hpp"
#include "runtime/child_process.hpp"

namespace enclave::runtime {

/**
 * A launched guest instance. Standardizes the interface of different
 * backends, e.g. a VM running the guest or the guest running directly as a
 * host process.
 */
class GuestInstance {
public:
    virtual ~GuestInstance() = default;

    // Wait for the guest to finish. Repeated calls return the same status.
    virtual WaitResult wait() = 0;

    // Non-blocking; `true` with `out` filled once the guest has exited.
    virtual bool try_wait(ExitStatus& out) = 0;

    // New channel onto the guest's data stream. Every call returns an
    // independent handle onto the same stream, so only one of them should
    // be reading at a time.
    virtual channel::ChannelResult connect() = 0;

    virtual pid_t pid() const = 0;

    // Kill the guest and release its resources. Takes ownership so an
    // instance can only be killed once.
    static WaitResult kill(std::unique_ptr<GuestInstance> instance);

protected:
    virtual WaitResult do_kill() = 0;
};

} // namespace enclave::runtime
