#include "channel/connector.hpp"
#include <spdlog/spdlog.h>

namespace enclave::channel {

namespace {

std::future<InvokeResult> ready_error(const Status& status) {
    std::promise<InvokeResult> promise;
    InvokeResult result;
    result.status = status;
    promise.set_value(std::move(result));
    return promise.get_future();
}

Status closed_status() {
    return Status::error(ErrorKind::CONNECTION_CLOSED, "connector closed");
}

} // namespace

Connector::Connector(Token, std::unique_ptr<Channel> channel, uint32_t max_frame_len)
    : channel_(std::move(channel))
    , max_frame_len_(max_frame_len) {}

Connector::~Connector() {
    close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

ConnectorHandle Connector::spawn(std::unique_ptr<Channel> channel, uint32_t max_frame_len) {
    auto connector = std::make_shared<Connector>(Token{}, std::move(channel), max_frame_len);
    connector->worker_ = std::thread(&Connector::worker_loop, connector.get());
    spdlog::debug("Connector started");
    return ConnectorHandle(connector);
}

std::future<InvokeResult> Connector::invoke(std::vector<uint8_t> request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        return ready_error(failure_.ok() ? closed_status() : failure_);
    }

    Request req;
    req.payload = std::move(request);
    auto future = req.promise.get_future();
    queue_.push_back(std::move(req));
    cv_.notify_one();
    return future;
}

void Connector::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    // Unblocks a worker waiting on the guest.
    channel_->shutdown();
    cv_.notify_all();
    spdlog::debug("Connector closing");
}

bool Connector::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

void Connector::fail_pending(std::deque<Request>& pending, const Status& status) {
    for (auto& req : pending) {
        InvokeResult result;
        result.status = status;
        req.promise.set_value(std::move(result));
    }
    pending.clear();
}

void Connector::worker_loop() {
    while (true) {
        Request req;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                std::deque<Request> pending;
                pending.swap(queue_);
                Status status = failure_.ok() ? closed_status() : failure_;
                lock.unlock();
                fail_pending(pending, status);
                return;
            }
            req = std::move(queue_.front());
            queue_.pop_front();
        }

        InvokeResult result;
        result.status = send_frame(*channel_, req.payload);
        if (result.status.ok()) {
            FrameResult frame = receive_frame(*channel_, max_frame_len_);
            result.status = frame.status;
            result.response = std::move(frame.payload);
        }

        if (!result.status.ok()) {
            bool closing;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closing = stopping_;
                if (closing) {
                    result.status = closed_status();
                } else {
                    failure_ = result.status;
                    stopping_ = true;
                }
            }
            if (!closing) {
                spdlog::error("Connector channel failed: {}", result.status.to_string());
            }
        }

        req.promise.set_value(std::move(result));
    }
}

ConnectorHandle::ConnectorHandle(std::shared_ptr<Connector> connector)
    : connector_(std::move(connector)) {}

std::future<InvokeResult> ConnectorHandle::invoke(std::vector<uint8_t> request) const {
    if (!connector_) {
        return ready_error(Status::error(ErrorKind::CONNECTION_CLOSED, "connector not started"));
    }
    return connector_->invoke(std::move(request));
}

void ConnectorHandle::close() const {
    if (connector_) {
        connector_->close();
    }
}

} // namespace enclave::channel
