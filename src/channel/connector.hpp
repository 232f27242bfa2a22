/**
 * Enclave Connector
 *
 * Bridges a raw guest channel to higher-level consumers. A worker thread owns
 * the channel; callers submit request frames and receive the matching
 * response frames through futures. Requests are written in submission order
 * and each response is matched to the oldest outstanding request, so results
 * come back in the order they arrive on the channel.
 */
#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "channel/channel.hpp"
#include "channel/framed.hpp"

namespace enclave::channel {

struct InvokeResult {
    Status status;
    std::vector<uint8_t> response;
};

class ConnectorHandle;

class Connector {
    struct Token {
        explicit Token() = default;
    };

public:
    Connector(Token, std::unique_ptr<Channel> channel, uint32_t max_frame_len);
    ~Connector();

    Connector(const Connector&) = delete;
    Connector& operator=(const Connector&) = delete;

    // Start the worker. The connector owns `channel` from here on; nobody
    // else may read or write it.
    static ConnectorHandle spawn(std::unique_ptr<Channel> channel,
                                 uint32_t max_frame_len = kDefaultMaxFrameBytes);

    std::future<InvokeResult> invoke(std::vector<uint8_t> request);

    // Stop the worker. Outstanding requests complete with CONNECTION_CLOSED.
    void close();

    bool is_open() const;

private:
    struct Request {
        std::vector<uint8_t> payload;
        std::promise<InvokeResult> promise;
    };

    void worker_loop();
    void fail_pending(std::deque<Request>& pending, const Status& status);

    std::unique_ptr<Channel> channel_;
    uint32_t max_frame_len_;

    std::deque<Request> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    Status failure_;  // First channel error; the connector is closed once set

    std::thread worker_;
};

// Shared, copyable reference to a running connector. The worker stops when
// the last handle goes away.
class ConnectorHandle {
public:
    ConnectorHandle() = default;

    std::future<InvokeResult> invoke(std::vector<uint8_t> request) const;
    void close() const;
    bool valid() const { return connector_ != nullptr; }
    bool is_open() const { return connector_ && connector_->is_open(); }

private:
    friend class Connector;
    explicit ConnectorHandle(std::shared_ptr<Connector> connector);

    std::shared_ptr<Connector> connector_;
};

} // namespace enclave::channel
