/**
 * Enclave Channel
 *
 * Duplex byte stream into a guest. The launcher hands out channels backed by
 * one end of a Unix socket pair; the other end belongs to the guest monitor.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include "core/status.hpp"
#include "core/unique_fd.hpp"

namespace enclave::channel {

class Channel;

struct ChannelResult {
    Status status;
    std::unique_ptr<Channel> channel;
};

class Channel {
public:
    using Deadline = std::chrono::steady_clock::time_point;

    virtual ~Channel() = default;

    // Read exactly `len` bytes. CONNECTION_CLOSED if the peer closes first,
    // TIMED_OUT if the I/O deadline passes.
    virtual Status read_exact(uint8_t* buf, size_t len) = 0;

    // Write all `len` bytes. TIMED_OUT if the I/O deadline passes.
    virtual Status write_all(const uint8_t* buf, size_t len) = 0;

    // Bound every following read and write on this handle by an absolute
    // deadline; nullopt restores unbounded blocking. Duplicates made with
    // try_clone() keep their own deadline.
    virtual void set_io_deadline(std::optional<Deadline> deadline) = 0;

    // Shut down both directions. Unblocks readers on every duplicate.
    virtual void shutdown() = 0;

    // New independent handle onto the same stream.
    virtual ChannelResult try_clone() const = 0;
};

/**
 * Channel over a connected SOCK_STREAM Unix socket
 */
class UnixChannel : public Channel {
public:
    explicit UnixChannel(core::UniqueFd fd);

    Status read_exact(uint8_t* buf, size_t len) override;
    Status write_all(const uint8_t* buf, size_t len) override;
    void set_io_deadline(std::optional<Deadline> deadline) override;
    void shutdown() override;
    ChannelResult try_clone() const override;

    int fd() const { return fd_.get(); }

private:
    core::UniqueFd fd_;
    std::optional<Deadline> deadline_;

    // Wait until `events` are ready or the deadline passes
    Status wait_ready(short events) const;
};

// Connected pair of close-on-exec Unix stream sockets.
Status make_socket_pair(core::UniqueFd& first, core::UniqueFd& second);

// Close-on-exec duplicate of `fd`.
Status duplicate_fd(int fd, core::UniqueFd& out);

} // namespace enclave::channel
