#include "channel/channel.hpp"
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <string>

namespace enclave::channel {

UnixChannel::UnixChannel(core::UniqueFd fd)
    : fd_(std::move(fd)) {}

Status UnixChannel::wait_ready(short events) const {
    if (!deadline_) {
        return Status::success();
    }

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline_ - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return Status::error(ErrorKind::TIMED_OUT, "I/O deadline exceeded");
        }

        struct pollfd pfd;
        pfd.fd = fd_.get();
        pfd.events = events;
        pfd.revents = 0;

        // Round up so we never wake just before the deadline and spin.
        int ret = poll(&pfd, 1, static_cast<int>(remaining.count()) + 1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return Status::from_errno("poll", errno);
        }
        if (ret == 0) {
            continue;  // Re-check the clock; reports TIMED_OUT once it has passed
        }
        // POLLHUP/POLLERR are surfaced by the following recv/send.
        return Status::success();
    }
}

Status UnixChannel::read_exact(uint8_t* buf, size_t len) {
    size_t done = 0;
    while (done < len) {
        Status ready = wait_ready(POLLIN);
        if (!ready.ok()) {
            return ready;
        }

        ssize_t n = ::recv(fd_.get(), buf + done, len - done, deadline_ ? MSG_DONTWAIT : 0);
        if (n == 0) {
            return Status::error(ErrorKind::CONNECTION_CLOSED,
                "peer closed the channel after " + std::to_string(done) +
                " of " + std::to_string(len) + " bytes");
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;  // Back to poll
            if (errno == ECONNRESET) {
                return Status::error(ErrorKind::CONNECTION_CLOSED, "connection reset by peer");
            }
            return Status::from_errno("recv", errno);
        }
        done += static_cast<size_t>(n);
    }
    return Status::success();
}

Status UnixChannel::write_all(const uint8_t* buf, size_t len) {
    size_t done = 0;
    while (done < len) {
        Status ready = wait_ready(POLLOUT);
        if (!ready.ok()) {
            return ready;
        }

        // Under a deadline send only what fits now, so a stalled reader
        // cannot hold us in the kernel past it.
        int flags = MSG_NOSIGNAL | (deadline_ ? MSG_DONTWAIT : 0);
        ssize_t n = ::send(fd_.get(), buf + done, len - done, flags);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;  // Back to poll
            if (errno == EPIPE || errno == ECONNRESET) {
                return Status::error(ErrorKind::CONNECTION_CLOSED, "peer closed the channel");
            }
            return Status::from_errno("send", errno);
        }
        done += static_cast<size_t>(n);
    }
    return Status::success();
}

void UnixChannel::set_io_deadline(std::optional<Deadline> deadline) {
    deadline_ = deadline;
}

void UnixChannel::shutdown() {
    if (fd_.valid()) {
        ::shutdown(fd_.get(), SHUT_RDWR);
    }
}

ChannelResult UnixChannel::try_clone() const {
    ChannelResult result;
    core::UniqueFd copy;
    result.status = duplicate_fd(fd_.get(), copy);
    if (result.status.ok()) {
        result.channel = std::make_unique<UnixChannel>(std::move(copy));
    }
    return result;
}

Status make_socket_pair(core::UniqueFd& first, core::UniqueFd& second) {
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
        return Status::from_errno("socketpair", errno);
    }
    first.reset(fds[0]);
    second.reset(fds[1]);
    return Status::success();
}

Status duplicate_fd(int fd, core::UniqueFd& out) {
    int copy = fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (copy < 0) {
        return Status::from_errno("dup", errno);
    }
    out.reset(copy);
    return Status::success();
}

} // namespace enclave::channel
