/**
 * Enclave Console Forwarder
 *
 * Drains the guest's serial console and logs each line through a logger
 * named after the guest.
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <spdlog/logger.h>
#include "core/unique_fd.hpp"

namespace enclave::runtime {

class ConsoleForwarder {
public:
    // Longer runs without a newline are split into records of this size
    static constexpr size_t kMaxLineBytes = 16 * 1024;

    ConsoleForwarder(core::UniqueFd console, std::shared_ptr<spdlog::logger> logger);
    ~ConsoleForwarder();

    // Non-copyable
    ConsoleForwarder(const ConsoleForwarder&) = delete;
    ConsoleForwarder& operator=(const ConsoleForwarder&) = delete;

    // Start the reader thread
    void start();

    // Wait for the guest to close its end of the console
    void join();

    // Unblock the reader and wait for it
    void stop();

    bool running() const { return running_; }
    size_t lines_forwarded() const { return lines_forwarded_; }

private:
    void reader_loop();
    void emit(const std::string& line);

    core::UniqueFd console_;
    std::shared_ptr<spdlog::logger> logger_;
    std::thread reader_thread_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> lines_forwarded_{0};
};

} // namespace enclave::runtime
