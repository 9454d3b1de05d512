#pragma once

#include <toolmux/core/result.hpp>
#include <toolmux/core/types.hpp>
#include <toolmux/process/i_worker_transport.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <sys/types.h>

namespace toolmux {

// ---------------------------------------------------------------------------
// WorkerProcess: a child process whose stdin/stdout form the channel.
//
// Launch() forks and execs the configured command; exec failures are
// reported synchronously through a close-on-exec status pipe. stderr is
// inherited from the coordinator.
//
// Terminate() closes the child's stdin, waits up to `shutdown_grace`, then
// escalates to SIGTERM and finally SIGKILL. The child is always reaped.
// ---------------------------------------------------------------------------
class WorkerProcess : public IWorkerTransport {
public:
    // Longest line ReadLine() accepts before failing with a Protocol error.
    static constexpr std::size_t kDefaultMaxLineBytes = 16 * 1024 * 1024;

    static Result<std::unique_ptr<WorkerProcess>, Error> Launch(
        const WorkerConfig& config,
        std::chrono::milliseconds shutdown_grace = std::chrono::milliseconds(2000));

    ~WorkerProcess() override;

    [[nodiscard]] Result<void, Error> WriteLine(std::string_view line) override;
    [[nodiscard]] Result<std::string, Error> ReadLine(
        std::chrono::milliseconds timeout) override;
    [[nodiscard]] Result<void, Error> Terminate() override;
    [[nodiscard]] bool IsRunning() override;
    [[nodiscard]] const std::string& Name() const noexcept override { return name_; }

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }

    void SetMaxLineBytes(std::size_t limit) noexcept { max_line_bytes_ = limit; }

    // Raw wait status once the child has been reaped.
    [[nodiscard]] std::optional<int> ExitStatus() const;

private:
    WorkerProcess(std::string name, pid_t pid, int stdin_fd, int stdout_fd,
                  std::chrono::milliseconds shutdown_grace);

    bool TryReap();
    bool WaitForExit(std::chrono::milliseconds timeout);
    Error MakeError(ErrorCategory category, const std::string& operation,
                    const std::string& message) const;

    std::string name_;
    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    std::chrono::milliseconds shutdown_grace_;

    std::string read_buffer_;
    std::size_t max_line_bytes_ = kDefaultMaxLineBytes;
    std::atomic<bool> terminated_{false};

    mutable std::mutex state_mutex_;  // guards stdin_fd_ and exit_status_
    std::optional<int> exit_status_;
};

} // namespace toolmux
