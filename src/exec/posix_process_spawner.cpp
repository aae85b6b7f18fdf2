#include <sre_gateway/exec/posix_process_spawner.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sre_gateway {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollSliceMs = 50;
constexpr size_t kReadChunk = 64 * 1024;
constexpr int kUnknownExitStatus = 255;

// Reported by the child through the CLOEXEC status pipe when it cannot exec.
struct ChildFailure {
    int stage;  // 0: chdir, 1: exec
    int error;
};

// Closes a descriptor once; safe to call repeatedly.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { Close(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    [[nodiscard]] int Get() const noexcept { return fd_; }
    [[nodiscard]] bool IsOpen() const noexcept { return fd_ >= 0; }

    void Reset(int fd) {
        Close();
        fd_ = fd;
    }

    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

bool MakePipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return true;
}

void SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Reads whatever is available. Returns false once the pipe reached EOF.
bool DrainAvailable(Fd& fd, std::string& sink) {
    char buffer[kReadChunk];
    while (true) {
        ssize_t n = ::read(fd.Get(), buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            fd.Close();
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        fd.Close();
        return false;
    }
}

[[noreturn]] void ReportChildFailure(int status_fd, int stage) {
    ChildFailure failure{stage, errno};
    ssize_t ignored = ::write(status_fd, &failure, sizeof(failure));
    (void)ignored;
    ::_exit(127);
}

// Terminates the whole group: SIGTERM, grace period, SIGKILL, reap.
int KillGroupAndReap(pid_t pid, std::chrono::milliseconds grace) {
    int status = 0;
    ::killpg(pid, SIGTERM);

    const auto kill_deadline = Clock::now() + grace;
    while (Clock::now() < kill_deadline) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            ::killpg(pid, SIGKILL);  // stragglers that ignored SIGTERM
            return status;
        }
        if (w < 0 && errno != EINTR) {
            return status;
        }
        ::usleep(10 * 1000);
    }

    ::killpg(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return status;
}

std::string DescribeChildFailure(const ChildFailure& failure, const Command& command) {
    std::string what = failure.stage == 0
        ? "cannot change directory to '" + command.working_directory + "'"
        : "cannot execute '" + command.argv.front() + "'";
    return what + ": " + std::strerror(failure.error);
}

} // anonymous namespace

PosixProcessSpawner::PosixProcessSpawner() {
    // A child that exits before reading its stdin must surface as EPIPE on
    // write, not terminate the gateway.
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

SpawnOutcome PosixProcessSpawner::Spawn(const SpawnRequest& request) {
    const Command& command = request.command;
    SpawnOutcome outcome;

    if (command.argv.empty() || command.argv.front().empty()) {
        outcome.error = "empty argv";
        return outcome;
    }

    // Everything the child needs is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(command.argv.size() + 1);
    for (const auto& arg : command.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    envp.reserve(request.environment.size() + 1);
    for (const auto& entry : request.environment) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    const char* cwd = command.working_directory.empty()
        ? nullptr : command.working_directory.c_str();

    Fd stdin_read, stdin_write, stdout_read, stdout_write;
    Fd stderr_read, stderr_write, status_read, status_write;
    if (!MakePipe(stdin_read, stdin_write) || !MakePipe(stdout_read, stdout_write) ||
        !MakePipe(stderr_read, stderr_write) || !MakePipe(status_read, status_write)) {
        outcome.error = std::string("pipe failed: ") + std::strerror(errno);
        return outcome;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        outcome.error = std::string("fork failed: ") + std::strerror(errno);
        return outcome;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setpgid(0, 0);

        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        ::dup2(stdin_read.Get(), STDIN_FILENO);
        ::dup2(stdout_write.Get(), STDOUT_FILENO);
        ::dup2(stderr_write.Get(), STDERR_FILENO);

        if (cwd != nullptr && ::chdir(cwd) != 0) {
            ReportChildFailure(status_write.Get(), 0);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        ReportChildFailure(status_write.Get(), 1);
    }

    // Parent.
    ::setpgid(pid, pid);  // mirrors the child's call; whichever runs first wins
    stdin_read.Close();
    stdout_write.Close();
    stderr_write.Close();
    status_write.Close();

    ChildFailure failure{};
    ssize_t got;
    do {
        got = ::read(status_read.Get(), &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    status_read.Close();

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        outcome.error = DescribeChildFailure(failure, command);
        return outcome;
    }

    SetNonBlocking(stdout_read.Get());
    SetNonBlocking(stderr_read.Get());

    const std::string payload = command.stdin_data.value_or(std::string());
    size_t written = 0;
    if (payload.empty()) {
        stdin_write.Close();
    } else {
        SetNonBlocking(stdin_write.Get());
    }

    const auto deadline = Clock::now() + command.timeout;
    int status = 0;
    bool reaped = false;

    while (true) {
        if (request.cancel != nullptr && request.cancel->IsCancelled()) {
            KillGroupAndReap(pid, request.kill_grace);
            outcome.termination = Termination::Cancelled;
            return outcome;
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            KillGroupAndReap(pid, request.kill_grace);
            outcome.termination = Termination::TimedOut;
            return outcome;
        }

        if (!reaped) {
            pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                reaped = true;
            }
        }

        if (reaped) {
            // Whatever the child wrote is already buffered in the pipes.
            // Descendants that kept the pipes open are not waited for.
            if (stdout_read.IsOpen()) DrainAvailable(stdout_read, outcome.stdout_data);
            if (stderr_read.IsOpen()) DrainAvailable(stderr_read, outcome.stderr_data);
            break;
        }

        pollfd fds[3];
        nfds_t count = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (stdout_read.IsOpen()) {
            out_idx = static_cast<int>(count);
            fds[count++] = {stdout_read.Get(), POLLIN, 0};
        }
        if (stderr_read.IsOpen()) {
            err_idx = static_cast<int>(count);
            fds[count++] = {stderr_read.Get(), POLLIN, 0};
        }
        if (stdin_write.IsOpen()) {
            in_idx = static_cast<int>(count);
            fds[count++] = {stdin_write.Get(), POLLOUT, 0};
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - now).count();
        const int slice = static_cast<int>(std::min<long long>(remaining, kPollSliceMs));

        if (count == 0) {
            // All pipes closed; only the exit status is outstanding.
            ::usleep(10 * 1000);
            continue;
        }

        int ready = ::poll(fds, count, std::max(slice, 1));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            KillGroupAndReap(pid, request.kill_grace);
            outcome.termination = Termination::SpawnFailed;
            outcome.error = std::string("poll failed: ") + std::strerror(errno);
            return outcome;
        }

        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            DrainAvailable(stdout_read, outcome.stdout_data);
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            DrainAvailable(stderr_read, outcome.stderr_data);
        }
        if (in_idx >= 0) {
            if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                stdin_write.Close();
            } else if (fds[in_idx].revents & POLLOUT) {
                ssize_t n = ::write(stdin_write.Get(), payload.data() + written,
                                    payload.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == payload.size()) {
                        stdin_write.Close();
                    }
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    stdin_write.Close();  // EPIPE: child stopped reading
                }
            }
        }
    }

    if (WIFEXITED(status)) {
        outcome.termination = Termination::Exited;
        outcome.status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.termination = Termination::Signaled;
        outcome.status = WTERMSIG(status);
    } else {
        outcome.termination = Termination::Exited;
        outcome.status = kUnknownExitStatus;
    }
    return outcome;
}

} // namespace sre_gateway
