#pragma once

#include <toolmux/core/result.hpp>
#include <toolmux/core/types.hpp>
#include <toolmux/mcp/json_rpc.hpp>
#include <toolmux/process/i_worker_transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolmux {

struct SessionOptions {
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds request_timeout{30000};
};

/// Protocol revisions the session accepts in the handshake answer.
const std::vector<std::string>& SupportedProtocolVersions();

// ---------------------------------------------------------------------------
// ClientSession: handshake and request/response protocol with one worker.
//
// Initialize() must succeed exactly once before ListTools()/CallTool().
//
// One request at a time: a request issued while another is in flight fails
// immediately with ConcurrentCall; nothing is queued. Each request carries a
// fresh id and only the response with that id completes it, so a late answer
// to a timed-out request is discarded rather than returned to the next call.
// ---------------------------------------------------------------------------
class ClientSession {
public:
    explicit ClientSession(std::shared_ptr<IWorkerTransport> transport,
                           SessionOptions options = {});

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    [[nodiscard]] Result<void, Error> Initialize();

    [[nodiscard]] Result<std::vector<ToolDescriptor>, Error> ListTools();

    // Returns the text of the first content block ("" for empty content).
    [[nodiscard]] Result<std::string, Error> CallTool(
        const std::string& name, const nlohmann::json& arguments);

    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }
    [[nodiscard]] const std::string& ServerName() const noexcept {
        return transport_->Name();
    }
    [[nodiscard]] const std::string& NegotiatedVersion() const noexcept {
        return protocol_version_;
    }
    [[nodiscard]] const nlohmann::json& ServerInfo() const noexcept {
        return server_info_;
    }

private:
    // Send one request and wait for the response carrying its id.
    Result<RpcMessage, Error> RoundTrip(const std::string& method,
                                        const nlohmann::json& params,
                                        std::chrono::milliseconds timeout,
                                        const std::string& tool = "");
    void AnswerServerRequest(const RpcMessage& request);
    Error MakeError(ErrorCategory category, const std::string& operation,
                    const std::string& message,
                    const std::string& tool = "") const;

    std::shared_ptr<IWorkerTransport> transport_;
    SessionOptions options_;

    std::mutex in_flight_;
    std::int64_t next_id_ = 1;
    std::atomic<bool> initialized_{false};

    std::string protocol_version_;
    nlohmann::json server_info_ = nlohmann::json::object();
};

} // namespace toolmux
