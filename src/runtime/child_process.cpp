#include "runtime/child_process.hpp"
#include "core/unique_fd.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace enclave::runtime {

std::string ExitStatus::to_string() const {
    if (exited) {
        return "exit status " + std::to_string(code);
    }
    return "terminated by signal " + std::to_string(signal);
}

ExitStatus ExitStatus::from_wait_status(int status) {
    ExitStatus exit;
    if (WIFEXITED(status)) {
        exit.exited = true;
        exit.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit.signal = WTERMSIG(status);
    }
    return exit;
}

bool operator==(const ExitStatus& a, const ExitStatus& b) {
    return a.exited == b.exited && a.code == b.code && a.signal == b.signal;
}

bool operator!=(const ExitStatus& a, const ExitStatus& b) {
    return !(a == b);
}

ChildProcess::ChildProcess(Token, pid_t pid, bool kill_on_drop)
    : pid_(pid)
    , kill_on_drop_(kill_on_drop) {}

ChildProcess::~ChildProcess() {
    if (!kill_on_drop_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (reaped_) {
            return;
        }
    }

    spdlog::debug("Killing dropped child process (pid={})", pid_);
    Status status = start_kill();
    if (!status.ok()) {
        spdlog::warn("Failed to kill child {}: {}", pid_, status.to_string());
    }
    WaitResult result = wait();
    if (!result.status.ok()) {
        spdlog::warn("Failed to reap child {}: {}", pid_, result.status.to_string());
    }
}

SpawnResult ChildProcess::spawn(const SpawnOptions& options) {
    SpawnResult result;

    if (options.program.empty()) {
        result.status = Status::error(ErrorKind::SPAWN, "no program given");
        return result;
    }

    // Everything the child needs is prepared before fork(); between fork and
    // exec the child only makes async-signal-safe calls.
    std::vector<std::string> all = {options.program};
    all.insert(all.end(), options.args.begin(), options.args.end());
    std::vector<char*> argv;
    argv.reserve(all.size() + 1);
    for (auto& s : all) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    // The child reports a failed exec through this pipe; a successful exec
    // closes it without writing.
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        result.status = Status::error(ErrorKind::SPAWN,
            std::string("pipe: ") + std::strerror(errno));
        return result;
    }
    core::UniqueFd err_read(err_pipe[0]);
    core::UniqueFd err_write(err_pipe[1]);

    pid_t pid = fork();
    if (pid < 0) {
        result.status = Status::error(ErrorKind::SPAWN,
            std::string("fork: ") + std::strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process
        int err = 0;

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            if (devnull != STDIN_FILENO) {
                close(devnull);
            }
        }

        for (int fd : options.preserved_fds) {
            int flags = fcntl(fd, F_GETFD);
            if (flags < 0 || fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) < 0) {
                err = errno;
                (void)!write(err_write.get(), &err, sizeof(err));
                _exit(127);
            }
        }

        execvp(argv[0], argv.data());

        err = errno;
        (void)!write(err_write.get(), &err, sizeof(err));
        _exit(127);
    }

    // Parent process
    err_write.reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_read.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        result.status = Status::error(ErrorKind::SPAWN,
            "failed to execute " + options.program + ": " + std::strerror(child_errno));
        return result;
    }

    spdlog::debug("Spawned {} (pid={})", options.program, pid);
    result.process = std::make_unique<ChildProcess>(Token{}, pid, options.kill_on_drop);
    return result;
}

bool ChildProcess::reap_locked(int flags) {
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, flags);
    } while (ret < 0 && errno == EINTR);

    if (ret == pid_) {
        reaped_ = true;
        exit_ = ExitStatus::from_wait_status(status);
        return true;
    }
    return false;
}

WaitResult ChildProcess::wait() {
    WaitResult result;
    std::lock_guard<std::mutex> wait_lock(wait_mutex_);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (reaped_) {
            result.exit = exit_;
            return result;
        }
    }

    // Block without reaping so start_kill() can still signal a live pid.
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    while (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0) {
        if (errno == EINTR) continue;
        if (errno == ECHILD) break;  // Reaped meanwhile by try_wait()
        result.status = Status::from_errno("waitid", errno);
        return result;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!reaped_ && !reap_locked(0)) {
        result.status = Status::from_errno("waitpid", errno);
        return result;
    }
    result.exit = exit_;
    return result;
}

bool ChildProcess::try_wait(ExitStatus& out) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!reaped_ && !reap_locked(WNOHANG)) {
        return false;
    }
    out = exit_;
    return true;
}

Status ChildProcess::start_kill() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (reaped_) {
        return Status::success();
    }
    if (kill(pid_, SIGKILL) < 0 && errno != ESRCH) {
        return Status::from_errno("kill", errno);
    }
    return Status::success();
}

} // namespace enclave::runtime
