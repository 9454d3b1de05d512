#include <toolmux/process/worker_process.hpp>

#include <toolmux/core/log.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace toolmux {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);
constexpr auto kKillWait = std::chrono::milliseconds(1000);

std::string ErrnoText(int err) {
    return std::strerror(err);
}

// A worker that exits while we write would otherwise kill the coordinator.
void IgnoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        sigaction(SIGPIPE, &action, nullptr);
    });
}

// Inherited environment with the worker's overrides applied.
std::vector<std::string> BuildEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string var(*entry);
        auto key = var.substr(0, var.find('='));
        if (overrides.count(key) > 0) {
            continue;
        }
        env.push_back(std::move(var));
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> ToArgv(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void WaitBlocking(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

Error LaunchError(const std::string& name, const std::string& message) {
    return Error::Make(ErrorCategory::Launch, "Launch", message, name);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Launch
// ---------------------------------------------------------------------------
Result<std::unique_ptr<WorkerProcess>, Error> WorkerProcess::Launch(
    const WorkerConfig& config, std::chrono::milliseconds shutdown_grace) {
    using R = Result<std::unique_ptr<WorkerProcess>, Error>;

    if (config.command.empty()) {
        return R::Err(LaunchError(config.name, "no command configured"));
    }

    IgnoreSigpipeOnce();

    // Everything the child needs is built before fork().
    std::vector<std::string> argv_strings;
    argv_strings.push_back(config.command);
    argv_strings.insert(argv_strings.end(), config.args.begin(), config.args.end());
    auto env_strings = BuildEnvironment(config.env);
    auto argv = ToArgv(argv_strings);
    auto envp = ToArgv(env_strings);

    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (::pipe2(to_child, O_CLOEXEC) != 0 ||
        ::pipe2(from_child, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        for (int* fds : {to_child, from_child, status_pipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        return R::Err(LaunchError(config.name, "pipe2 failed: " + ErrnoText(err)));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        for (int* fds : {to_child, from_child, status_pipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        return R::Err(LaunchError(config.name, "fork failed: " + ErrnoText(err)));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::dup2(to_child[0], STDIN_FILENO);
        ::dup2(from_child[1], STDOUT_FILENO);
        ::execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    CloseFd(to_child[0]);
    CloseFd(from_child[1]);
    CloseFd(status_pipe[1]);

    // EOF on the status pipe means exec succeeded and closed it.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        CloseFd(to_child[1]);
        CloseFd(from_child[0]);
        WaitBlocking(pid);
        return R::Err(LaunchError(
            config.name,
            "cannot execute '" + config.command + "': " + ErrnoText(child_errno)));
    }

    LogInfo("process", "launched worker '" + config.name + "' (pid " +
                           std::to_string(pid) + "): " + config.command);
    return R::Ok(std::unique_ptr<WorkerProcess>(new WorkerProcess(
        config.name, pid, to_child[1], from_child[0], shutdown_grace)));
}

WorkerProcess::WorkerProcess(std::string name, pid_t pid, int stdin_fd,
                             int stdout_fd,
                             std::chrono::milliseconds shutdown_grace)
    : name_(std::move(name)),
      pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      shutdown_grace_(shutdown_grace) {}

WorkerProcess::~WorkerProcess() {
    auto result = Terminate();
    if (result.IsErr()) {
        LogWarn("process", result.Error().ToString());
    }
    CloseFd(stdout_fd_);
}

// ---------------------------------------------------------------------------
// I/O
// ---------------------------------------------------------------------------
Result<void, Error> WorkerProcess::WriteLine(std::string_view line) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (terminated_ || stdin_fd_ < 0) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Protocol, "WriteLine", "worker has been terminated"));
    }

    std::string frame(line);
    frame.push_back('\n');

    std::size_t written = 0;
    while (written < frame.size()) {
        const ssize_t n = ::write(stdin_fd_, frame.data() + written,
                                  frame.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            return Result<void, Error>::Err(MakeError(
                ErrorCategory::Protocol, "WriteLine",
                err == EPIPE ? "worker closed its input"
                             : "write failed: " + ErrnoText(err)));
        }
        written += static_cast<std::size_t>(n);
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> WorkerProcess::ReadLine(
    std::chrono::milliseconds timeout) {
    using R = Result<std::string, Error>;
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + timeout;

    while (true) {
        if (terminated_) {
            return R::Err(MakeError(ErrorCategory::Protocol, "ReadLine",
                                    "worker has been terminated"));
        }

        const auto newline = read_buffer_.find('\n');
        const auto pending = newline == std::string::npos ? read_buffer_.size() : newline;
        if (pending > max_line_bytes_) {
            // The rest of the oversized line is dropped with it.
            read_buffer_.erase(0, newline == std::string::npos ? std::string::npos
                                                             : newline + 1);
            return R::Err(MakeError(ErrorCategory::Protocol, "ReadLine",
                                    "line exceeds " + std::to_string(max_line_bytes_) +
                                        " bytes"));
        }
        if (newline != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return R::Ok(std::move(line));
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) {
            return R::Err(MakeError(
                ErrorCategory::Timeout, "ReadLine",
                "no response within " + std::to_string(timeout.count()) + " ms"));
        }

        pollfd pfd{stdout_fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return R::Err(MakeError(ErrorCategory::Protocol, "ReadLine",
                                    "poll failed: " + ErrnoText(errno)));
        }
        if (ready == 0) {
            continue;
        }

        char chunk[4096];
        const ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            read_buffer_.append(chunk, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return R::Err(MakeError(ErrorCategory::Protocol, "ReadLine",
                                    "worker closed its output"));
        }
        if (errno == EINTR || errno == EAGAIN) {
            continue;
        }
        return R::Err(MakeError(ErrorCategory::Protocol, "ReadLine",
                                "read failed: " + ErrnoText(errno)));
    }
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
Result<void, Error> WorkerProcess::Terminate() {
    if (terminated_.exchange(true)) {
        return Result<void, Error>::Ok();
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        CloseFd(stdin_fd_);
    }
    if (WaitForExit(shutdown_grace_)) {
        LogDebug("process", "worker '" + name_ + "' exited after stdin closed");
        return Result<void, Error>::Ok();
    }

    LogDebug("process", "worker '" + name_ + "' still running, sending SIGTERM");
    if (::kill(pid_, SIGTERM) != 0 && errno != ESRCH) {
        LogWarn("process", "SIGTERM to worker '" + name_ + "' failed: " +
                               ErrnoText(errno));
    }
    if (WaitForExit(shutdown_grace_)) {
        return Result<void, Error>::Ok();
    }

    LogWarn("process", "worker '" + name_ + "' ignored SIGTERM, sending SIGKILL");
    if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Internal, "Terminate", "SIGKILL failed: " + ErrnoText(errno)));
    }
    if (!WaitForExit(kKillWait)) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Internal, "Terminate", "worker did not exit after SIGKILL"));
    }
    return Result<void, Error>::Ok();
}

bool WorkerProcess::IsRunning() {
    return !TryReap();
}

std::optional<int> WorkerProcess::ExitStatus() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_status_;
}

bool WorkerProcess::TryReap() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (exit_status_.has_value()) {
        return true;
    }
    int status = 0;
    const pid_t reaped = ::waitpid(pid_, &status, WNOHANG);
    if (reaped == pid_) {
        exit_status_ = status;
        return true;
    }
    if (reaped < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing left to wait for.
        exit_status_ = -1;
        return true;
    }
    return false;
}

bool WorkerProcess::WaitForExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (TryReap()) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

Error WorkerProcess::MakeError(ErrorCategory category,
                               const std::string& operation,
                               const std::string& message) const {
    return Error::Make(category, operation, message, name_);
}

} // namespace toolmux
