#pragma once

#include <toolmux/core/result.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace toolmux {

// ---------------------------------------------------------------------------
// IWorkerTransport: line-framed, bidirectional channel to one worker.
//
// ClientSession depends on this interface rather than on a concrete process,
// so the protocol logic is testable offline via MockWorkerTransport.
//
// Methods return Result<T, Error> and never throw on expected failures.
// ---------------------------------------------------------------------------
class IWorkerTransport {
public:
    virtual ~IWorkerTransport() = default;

    // Non-copyable, non-movable (polymorphic base).
    IWorkerTransport(const IWorkerTransport&) = delete;
    IWorkerTransport& operator=(const IWorkerTransport&) = delete;
    IWorkerTransport(IWorkerTransport&&) = delete;
    IWorkerTransport& operator=(IWorkerTransport&&) = delete;

    // Write one frame. A trailing newline is appended.
    [[nodiscard]] virtual Result<void, Error> WriteLine(std::string_view line) = 0;

    // Read the next complete frame, without its newline.
    // Timeout category on expiry, Protocol category when the peer closed.
    [[nodiscard]] virtual Result<std::string, Error> ReadLine(
        std::chrono::milliseconds timeout) = 0;

    // Shut the worker down. Idempotent and bounded in time; the transport
    // refuses further I/O afterwards.
    [[nodiscard]] virtual Result<void, Error> Terminate() = 0;

    [[nodiscard]] virtual bool IsRunning() = 0;

    // Worker name used in diagnostics.
    [[nodiscard]] virtual const std::string& Name() const noexcept = 0;

protected:
    IWorkerTransport() = default;
};

} // namespace toolmux
