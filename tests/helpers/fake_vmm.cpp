/**
 * Stand-in for the guest monitor in lifecycle tests.
 *
 * Understands the console and data socket arguments of a real monitor
 * (-chardev socket,id=consock|commsock,fd=N) and ignores everything else.
 * Behaviour is picked with FAKE_VMM_MODE:
 *   echo   - answer every frame on the data socket with the same frame
 *   silent - never touch the data socket, run until killed
 *   exit   - exit right away with FAKE_VMM_EXIT_CODE (default 0)
 *   watch  - watch the data socket for 500ms; exit 0 if nothing arrived,
 *            kDataSeenExitCode otherwise
 * FAKE_VMM_CONSOLE is written to the console before anything else.
 */
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <poll.h>
#include <unistd.h>
#include "channel/framed.hpp"

namespace {

constexpr int kDataSeenExitCode = 10;

bool read_all(int fd, uint8_t* buf, size_t len) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::read(fd, buf + done, len - done);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        done += static_cast<size_t>(n);
    }
    return true;
}

bool write_all(int fd, const uint8_t* buf, size_t len) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::write(fd, buf + done, len - done);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        done += static_cast<size_t>(n);
    }
    return true;
}

int fd_from_chardev(const std::string& spec, const std::string& id) {
    if (spec.find("id=" + id) == std::string::npos) {
        return -1;
    }
    auto pos = spec.find("fd=");
    if (pos == std::string::npos) {
        return -1;
    }
    return std::atoi(spec.c_str() + pos + 3);
}

void write_console(int fd, const std::string& text) {
    if (fd >= 0 && !text.empty()) {
        write_all(fd, reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }
}

int run_echo(int data_fd) {
    using enclave::channel::kFramePrefixBytes;
    while (true) {
        uint8_t prefix[kFramePrefixBytes];
        if (!read_all(data_fd, prefix, sizeof(prefix))) {
            return 0;  // Host went away
        }
        uint32_t len = enclave::channel::decode_frame_prefix(prefix);
        std::vector<uint8_t> payload(len);
        if (len > 0 && !read_all(data_fd, payload.data(), len)) {
            return 1;
        }
        if (!write_all(data_fd, prefix, sizeof(prefix)) ||
            (len > 0 && !write_all(data_fd, payload.data(), len))) {
            return 1;
        }
    }
}

int run_watch(int data_fd) {
    struct pollfd pfd;
    pfd.fd = data_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret;
    do {
        ret = poll(&pfd, 1, 500);
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) {
        return 1;
    }
    return (ret > 0 && (pfd.revents & POLLIN)) ? kDataSeenExitCode : 0;
}

} // namespace

int main(int argc, char** argv) {
    int console_fd = -1;
    int data_fd = -1;

    for (int i = 1; i + 1 < argc; ++i) {
        if (std::strcmp(argv[i], "-chardev") != 0) continue;
        std::string spec = argv[i + 1];
        if (int fd = fd_from_chardev(spec, "consock"); fd >= 0) console_fd = fd;
        if (int fd = fd_from_chardev(spec, "commsock"); fd >= 0) data_fd = fd;
    }

    if (console_fd < 0 || data_fd < 0) {
        return 64;
    }

    const char* console_text = std::getenv("FAKE_VMM_CONSOLE");
    write_console(console_fd, console_text ? console_text : "fake vmm booting\n");

    const char* mode_env = std::getenv("FAKE_VMM_MODE");
    std::string mode = mode_env ? mode_env : "echo";

    if (mode == "exit") {
        const char* code = std::getenv("FAKE_VMM_EXIT_CODE");
        return code ? std::atoi(code) : 0;
    }
    if (mode == "watch") {
        return run_watch(data_fd);
    }
    if (mode == "silent") {
        while (true) {
            pause();
        }
    }
    return run_echo(data_fd);
}
