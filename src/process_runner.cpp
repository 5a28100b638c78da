#include "megadl/process_runner.hpp"

#include "megadl/logging.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace megadl {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kTerminateGrace = std::chrono::milliseconds(2000);
constexpr auto kReapPollStep = std::chrono::milliseconds(20);

class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    [[nodiscard]] int get() const { return fd_; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Waits for `pid` until `deadline`; returns the raw status when it exited.
std::optional<int> reapUntil(pid_t pid, Clock::time_point deadline) {
    while (true) {
        int status = 0;
        const pid_t res = ::waitpid(pid, &status, WNOHANG);
        if (res == pid) {
            return status;
        }
        if (res < 0 && errno != EINTR) {
            return std::nullopt;
        }
        if (Clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(kReapPollStep);
    }
}

void terminateGroup(pid_t pid) {
    ::kill(-pid, SIGTERM);
    if (reapUntil(pid, Clock::now() + kTerminateGrace)) {
        // leader is gone, make sure stragglers in the group follow it
        ::kill(-pid, SIGKILL);
        return;
    }

    ::kill(-pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

[[noreturn]] void execChild(const std::string& command, int out_fd) {
    ::setpgid(0, 0);

    const int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
        ::close(null_fd);
    }
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(out_fd, STDERR_FILENO);

    ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    ::_exit(127);
}

} // namespace

ProcessResult runCommand(const std::string& command, std::chrono::milliseconds timeout) {
    ProcessResult result;
    logger()->debug("run: {}", command);

    std::array<int, 2> fds{-1, -1};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        result.error_message = std::string{"pipe failed: "} + std::strerror(errno);
        return result;
    }
    FdGuard read_end{fds[0]};
    FdGuard write_end{fds[1]};

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.error_message = std::string{"fork failed: "} + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        execChild(command, write_end.get());
    }

    // Both sides set the group so kill(-pid) works whichever runs first.
    ::setpgid(pid, pid);
    write_end.reset();

    const auto deadline = Clock::now() + timeout;
    std::array<char, 4096> buffer{};
    bool timed_out = false;

    while (true) {
        const auto now = Clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        pollfd pfd{read_end.get(), POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error_message = std::string{"poll failed: "} + std::strerror(errno);
            terminateGroup(pid);
            return result;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = ::read(read_end.get(), buffer.data(), buffer.size());
        if (n > 0) {
            result.output.append(buffer.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            break;
        }
        if (errno != EINTR && errno != EAGAIN) {
            result.error_message = std::string{"read failed: "} + std::strerror(errno);
            terminateGroup(pid);
            return result;
        }
    }

    if (!timed_out) {
        // Output closed; the shell may still be finishing.
        if (const auto status = reapUntil(pid, deadline)) {
            result.exit_code = decodeStatus(*status);
            result.outcome = RunOutcome::Completed;
            return result;
        }
    }

    terminateGroup(pid);
    result.outcome = RunOutcome::TimedOut;
    result.error_message = "command timed out";
    logger()->debug("timed out after {} ms: {}", timeout.count(), command);
    return result;
}

std::string shellQuote(const std::string& text) {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted.push_back('\'');
    for (const char c : text) {
        if (c == '\'') {
            quoted.append("'\\''");
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

const char* toString(RunOutcome outcome) {
    switch (outcome) {
    case RunOutcome::Completed:
        return "completed";
    case RunOutcome::TimedOut:
        return "timed out";
    case RunOutcome::SpawnError:
        return "spawn error";
    }
    return "unknown";
}

} // namespace megadl
