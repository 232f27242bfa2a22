#include "runtime/console_forwarder.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace enclave::runtime {

ConsoleForwarder::ConsoleForwarder(core::UniqueFd console, std::shared_ptr<spdlog::logger> logger)
    : console_(std::move(console))
    , logger_(std::move(logger)) {}

ConsoleForwarder::~ConsoleForwarder() {
    stop();
}

void ConsoleForwarder::start() {
    if (running_ || reader_thread_.joinable()) {
        return;
    }
    running_ = true;
    reader_thread_ = std::thread(&ConsoleForwarder::reader_loop, this);
}

void ConsoleForwarder::join() {
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
}

void ConsoleForwarder::stop() {
    if (running_ && console_.valid()) {
        // Wakes a blocked read(); it then sees EOF
        if (::shutdown(console_.get(), SHUT_RDWR) < 0 && errno != ENOTCONN) {
            spdlog::debug("Console shutdown: {}", std::strerror(errno));
        }
    }
    join();
}

void ConsoleForwarder::reader_loop() {
    std::string buffer;
    char chunk[4096];

    while (true) {
        ssize_t n = ::read(console_.get(), chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            spdlog::warn("Reading guest console failed: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;  // EOF
        }

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            emit(buffer.substr(0, pos));
            buffer.erase(0, pos + 1);
        }
        while (buffer.size() >= kMaxLineBytes) {
            emit(buffer.substr(0, kMaxLineBytes));
            buffer.erase(0, kMaxLineBytes);
        }
    }

    if (!buffer.empty()) {
        emit(buffer);
    }
    spdlog::debug("Guest console closed after {} lines", lines_forwarded_.load());
    running_ = false;
}

void ConsoleForwarder::emit(const std::string& line) {
    ++lines_forwarded_;
    try {
        logger_->info("{}", line);
    } catch (const std::exception&) {
        // Console output is best effort
    }
}

} // namespace enclave::runtime
