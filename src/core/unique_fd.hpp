#pragma once
#include <unistd.h>

namespace enclave::core {

// Owning file descriptor. Closes on destruction.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}

    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    explicit operator bool() const { return valid(); }

    int release() {
        int detached = fd_;
        fd_ = -1;
        return detached;
    }

    void reset(int replacement = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = replacement;
    }

private:
    int fd_ = -1;
};

} // namespace enclave::core
