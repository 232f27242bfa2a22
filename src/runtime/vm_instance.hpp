#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>
#include "channel/channel.hpp"
#include "core/unique_fd.hpp"
#include "runtime/child_process.hpp"
#include "runtime/guest_instance.hpp"
#include "runtime/params.hpp"

namespace enclave::runtime {

class VmInstance;

struct StartResult {
    Status status;
    std::unique_ptr<VmInstance> instance;
    std::vector<uint8_t> evidence;  // Empty unless evidence was exchanged
};

/**
 * Guest running inside a VM started by the guest monitor (QEMU).
 *
 * Owns a copy of the console socket (for shutdown), the host end of the data
 * socket pair and the monitor process. An instance that is destroyed without
 * GuestInstance::kill() still kills and reaps the monitor.
 */
class VmInstance : public GuestInstance {
    struct Token {
        explicit Token() = default;
    };

public:
    VmInstance(Token,
               core::UniqueFd guest_console,
               std::unique_ptr<channel::UnixChannel> host_socket,
               std::unique_ptr<ChildProcess> process);
    ~VmInstance() override;

    VmInstance(const VmInstance&) = delete;
    VmInstance& operator=(const VmInstance&) = delete;

    /**
     * Start the monitor with the given params; the guest writes its console
     * output to `guest_console`.
     *
     * When params.app_binary is set the initial data is delivered before this
     * returns. On failure nothing is left behind: sockets are closed and a
     * spawned monitor is killed and reaped.
     */
    static StartResult start(const Params& params, core::UniqueFd guest_console);

    WaitResult wait() override;
    bool try_wait(ExitStatus& out) override;
    channel::ChannelResult connect() override;
    pid_t pid() const override;

protected:
    WaitResult do_kill() override;

private:
    core::UniqueFd guest_console_;
    std::unique_ptr<channel::UnixChannel> host_socket_;
    std::unique_ptr<ChildProcess> process_;

    // Cleared by the first of kill() and the destructor
    std::atomic<bool> armed_{true};
};

} // namespace enclave::runtime
