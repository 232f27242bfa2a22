#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>
#include "core/status.hpp"

namespace enclave::runtime {

// How a child process ended
struct ExitStatus {
    bool exited = false;  // Normal exit; `code` is valid
    int code = 0;
    int signal = 0;       // Terminating signal when !exited

    bool success() const { return exited && code == 0; }
    std::string to_string() const;

    static ExitStatus from_wait_status(int status);
};

bool operator==(const ExitStatus& a, const ExitStatus& b);
bool operator!=(const ExitStatus& a, const ExitStatus& b);

struct WaitResult {
    Status status;
    ExitStatus exit;
};

struct SpawnOptions {
    std::string program;              // Looked up in PATH when it has no '/'
    std::vector<std::string> args;    // Without argv[0]
    std::vector<int> preserved_fds;   // Inherited under the same numbers
    bool kill_on_drop = true;         // SIGKILL and reap when the handle is destroyed
};

class ChildProcess;

struct SpawnResult {
    Status status;
    std::unique_ptr<ChildProcess> process;
};

/**
 * Handle to a spawned child process.
 *
 * Every descriptor of the parent is expected to be close-on-exec; the child
 * clears the flag on exactly `preserved_fds`. stdin is /dev/null, stdout and
 * stderr are inherited. The child is not tied to the lifetime of the thread
 * that spawned it; only kill_on_drop or start_kill() end it.
 *
 * wait(), try_wait() and start_kill() may be called from different threads.
 * The child is reaped exactly once and never signalled after being reaped.
 */
class ChildProcess {
    struct Token {
        explicit Token() = default;
    };

public:
    ChildProcess(Token, pid_t pid, bool kill_on_drop);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    static SpawnResult spawn(const SpawnOptions& options);

    pid_t pid() const { return pid_; }

    // Block until the child exits. Later calls return the cached status.
    WaitResult wait();

    // Non-blocking; `true` with `out` filled once the child has exited.
    bool try_wait(ExitStatus& out);

    // Request SIGKILL. Not an error when the child has already exited.
    Status start_kill();

    // Give up kill-on-drop, e.g. when handing the child to someone else.
    void set_kill_on_drop(bool enabled) { kill_on_drop_ = enabled; }

private:
    // Reap with waitpid; requires state_mutex_
    bool reap_locked(int flags);

    pid_t pid_;
    bool kill_on_drop_;

    std::mutex wait_mutex_;   // Serializes blocking waiters
    std::mutex state_mutex_;  // Guards reaped_/exit_ and signalling
    bool reaped_ = false;
    ExitStatus exit_;
};

} // namespace enclave::runtime
