#include <toolmux/session/client_session.hpp>

#include <toolmux/core/log.hpp>
#include <toolmux/core/version.hpp>

#include <algorithm>
#include <optional>
#include <set>

namespace toolmux {

namespace {

constexpr const char* kComponent = "session";

// Worker-controlled fields are type-checked before they are read.
bool IsTextBlock(const nlohmann::json& block) {
    return block.is_object() && block.contains("type") && block["type"].is_string() &&
           block["type"].get<std::string>() == "text" && block.contains("text") &&
           block["text"].is_string();
}

// Join the text of every text block; used for isError payloads that may
// spread the message over several blocks.
std::string JoinText(const nlohmann::json& content) {
    std::string joined;
    if (!content.is_array()) {
        return joined;
    }
    for (const auto& block : content) {
        if (IsTextBlock(block)) {
            if (!joined.empty()) {
                joined += "\n";
            }
            joined += block["text"].get<std::string>();
        }
    }
    return joined;
}

} // anonymous namespace

const std::vector<std::string>& SupportedProtocolVersions() {
    static const std::vector<std::string> versions = {
        "2024-11-05",
        "2025-03-26",
        "2025-06-18",
    };
    return versions;
}

ClientSession::ClientSession(std::shared_ptr<IWorkerTransport> transport,
                             SessionOptions options)
    : transport_(std::move(transport)), options_(options) {}

// ---------------------------------------------------------------------------
// Initialize
// ---------------------------------------------------------------------------
Result<void, Error> ClientSession::Initialize() {
    std::unique_lock<std::mutex> lock(in_flight_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::ConcurrentCall, "Initialize",
            "another request is in flight on this session"));
    }
    if (initialized_) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Handshake, "Initialize", "session is already initialized"));
    }

    nlohmann::json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "toolmux"}, {"version", kVersion}}}
    };

    auto response = RoundTrip("initialize", params, options_.handshake_timeout);
    if (response.IsErr()) {
        const auto& cause = response.Error();
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Handshake, "Initialize",
            "handshake failed (" + cause.CategoryName() + "): " + cause.message));
    }

    const auto& msg = response.Value();
    if (msg.error.has_value()) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Handshake, "Initialize",
            "worker rejected initialize: " + msg.error->message));
    }

    const auto& result = *msg.result;
    if (!result.is_object() || !result.contains("protocolVersion") ||
        !result["protocolVersion"].is_string()) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Handshake, "Initialize",
            "initialize result carries no protocolVersion"));
    }

    auto version = result["protocolVersion"].get<std::string>();
    const auto& supported = SupportedProtocolVersions();
    if (std::find(supported.begin(), supported.end(), version) == supported.end()) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Handshake, "Initialize",
            "incompatible protocol version '" + version + "'"));
    }

    auto notify = transport_->WriteLine(
        MakeNotification("notifications/initialized").dump());
    if (notify.IsErr()) {
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::Handshake, "Initialize",
            "could not confirm initialization: " + notify.Error().message));
    }

    protocol_version_ = std::move(version);
    if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
        server_info_ = result["serverInfo"];
    }
    std::string server_label = "?";
    if (server_info_.contains("name") && server_info_["name"].is_string()) {
        server_label = server_info_["name"].get<std::string>();
    }
    initialized_ = true;

    LogInfo(kComponent, "worker '" + ServerName() + "' initialized (protocol " +
                            protocol_version_ + ", server " + server_label + ")");
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ListTools
// ---------------------------------------------------------------------------
Result<std::vector<ToolDescriptor>, Error> ClientSession::ListTools() {
    using R = Result<std::vector<ToolDescriptor>, Error>;

    std::unique_lock<std::mutex> lock(in_flight_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return R::Err(MakeError(ErrorCategory::ConcurrentCall, "ListTools",
                                "another request is in flight on this session"));
    }
    if (!initialized_) {
        return R::Err(MakeError(ErrorCategory::NotInitialized, "ListTools",
                                "Initialize() has not completed"));
    }

    std::vector<ToolDescriptor> tools;
    std::set<std::string> seen_cursors;
    std::optional<std::string> cursor;

    do {
        nlohmann::json params = nlohmann::json::object();
        if (cursor) {
            params["cursor"] = *cursor;
        }

        auto response = RoundTrip("tools/list", params, options_.request_timeout);
        if (response.IsErr()) {
            return R::Err(std::move(response).Error());
        }
        const auto& msg = response.Value();
        if (msg.error.has_value()) {
            return R::Err(MakeError(ErrorCategory::Protocol, "ListTools",
                                    "worker rejected tools/list: " + msg.error->message));
        }

        const auto& result = *msg.result;
        if (!result.is_object() || !result.contains("tools") ||
            !result["tools"].is_array()) {
            return R::Err(MakeError(ErrorCategory::Protocol, "ListTools",
                                    "tools/list result carries no tools array"));
        }

        for (const auto& entry : result["tools"]) {
            if (!entry.is_object() || !entry.contains("name") ||
                !entry["name"].is_string()) {
                return R::Err(MakeError(ErrorCategory::Protocol, "ListTools",
                                        "tool entry without a name: " + entry.dump()));
            }
            ToolDescriptor tool;
            tool.name = entry["name"].get<std::string>();
            if (entry.contains("description") && entry["description"].is_string()) {
                tool.description = entry["description"].get<std::string>();
            }
            if (entry.contains("inputSchema") && entry["inputSchema"].is_object()) {
                tool.input_schema = entry["inputSchema"];
            }
            tools.push_back(std::move(tool));
        }

        cursor.reset();
        if (result.contains("nextCursor") && result["nextCursor"].is_string()) {
            auto next = result["nextCursor"].get<std::string>();
            if (!next.empty() && seen_cursors.insert(next).second) {
                cursor = std::move(next);
            }
        }
    } while (cursor);

    LogDebug(kComponent, "worker '" + ServerName() + "' offers " +
                             std::to_string(tools.size()) + " tool(s)");
    return R::Ok(std::move(tools));
}

// ---------------------------------------------------------------------------
// CallTool
// ---------------------------------------------------------------------------
Result<std::string, Error> ClientSession::CallTool(const std::string& name,
                                                   const nlohmann::json& arguments) {
    using R = Result<std::string, Error>;

    std::unique_lock<std::mutex> lock(in_flight_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return R::Err(MakeError(ErrorCategory::ConcurrentCall, "CallTool",
                                "another request is in flight on this session", name));
    }
    if (!initialized_) {
        return R::Err(MakeError(ErrorCategory::NotInitialized, "CallTool",
                                "Initialize() has not completed", name));
    }
    if (!arguments.is_null() && !arguments.is_object()) {
        return R::Err(MakeError(ErrorCategory::Internal, "CallTool",
                                "arguments must be a JSON object", name));
    }

    nlohmann::json params = {
        {"name", name},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };

    auto response = RoundTrip("tools/call", params, options_.request_timeout, name);
    if (response.IsErr()) {
        return R::Err(std::move(response).Error());
    }
    const auto& msg = response.Value();
    if (msg.error.has_value()) {
        return R::Err(MakeError(ErrorCategory::ToolExecution, "CallTool",
                                msg.error->message, name));
    }

    const auto& result = *msg.result;
    if (!result.is_object() || !result.contains("content") ||
        !result["content"].is_array()) {
        return R::Err(MakeError(ErrorCategory::Protocol, "CallTool",
                                "tools/call result carries no content array", name));
    }
    const auto& content = result["content"];

    bool is_error = false;
    if (result.contains("isError")) {
        if (!result["isError"].is_boolean()) {
            return R::Err(MakeError(ErrorCategory::Protocol, "CallTool",
                                    "isError must be a boolean, got: " +
                                        result["isError"].dump(),
                                    name));
        }
        is_error = result["isError"].get<bool>();
    }
    if (is_error) {
        auto message = JoinText(content);
        if (message.empty()) {
            message = "tool reported an error";
        }
        return R::Err(MakeError(ErrorCategory::ToolExecution, "CallTool",
                                message, name));
    }

    if (content.empty()) {
        return R::Ok(std::string());
    }
    const auto& first = content[0];
    if (!IsTextBlock(first)) {
        return R::Err(MakeError(ErrorCategory::Protocol, "CallTool",
                                "first content block is not text: " + first.dump(),
                                name));
    }
    return R::Ok(first["text"].get<std::string>());
}

// ---------------------------------------------------------------------------
// Transport round trip
// ---------------------------------------------------------------------------
Result<RpcMessage, Error> ClientSession::RoundTrip(const std::string& method,
                                                   const nlohmann::json& params,
                                                   std::chrono::milliseconds timeout,
                                                   const std::string& tool) {
    using R = Result<RpcMessage, Error>;
    using Clock = std::chrono::steady_clock;

    const std::int64_t id = next_id_++;
    auto sent = transport_->WriteLine(MakeRequest(id, method, params).dump());
    if (sent.IsErr()) {
        auto error = std::move(sent).Error();
        error.tool = tool;
        return R::Err(std::move(error));
    }

    const auto deadline = Clock::now() + timeout;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) {
            return R::Err(MakeError(
                ErrorCategory::Timeout, method,
                "no response within " + std::to_string(timeout.count()) + " ms", tool));
        }

        auto line = transport_->ReadLine(remaining);
        if (line.IsErr()) {
            auto error = std::move(line).Error();
            if (error.category == ErrorCategory::Timeout) {
                return R::Err(MakeError(
                    ErrorCategory::Timeout, method,
                    "no response within " + std::to_string(timeout.count()) + " ms",
                    tool));
            }
            error.tool = tool;
            return R::Err(std::move(error));
        }
        if (line.Value().empty()) {
            continue;
        }

        auto parsed = ParseRpcMessage(line.Value());
        if (parsed.IsErr()) {
            return R::Err(MakeError(ErrorCategory::Protocol, method,
                                    parsed.Error().message, tool));
        }
        auto msg = std::move(parsed).Value();

        if (msg.IsNotification()) {
            LogDebug(kComponent, "worker '" + ServerName() + "' notification: " +
                                     msg.method);
            continue;
        }
        if (msg.IsRequest()) {
            AnswerServerRequest(msg);
            continue;
        }
        if (!msg.id.has_value() || *msg.id != nlohmann::json(id)) {
            LogDebug(kComponent, "discarding stale response from '" + ServerName() +
                                     "' (id " + (msg.id ? msg.id->dump() : "none") +
                                     ", waiting for " + std::to_string(id) + ")");
            continue;
        }
        return R::Ok(std::move(msg));
    }
}

// Workers may ping the client; everything else is politely refused.
void ClientSession::AnswerServerRequest(const RpcMessage& request) {
    nlohmann::json reply;
    if (request.method == "ping") {
        reply = MakeResultResponse(*request.id, nlohmann::json::object());
    } else {
        reply = MakeErrorResponse(*request.id, rpc_code::kMethodNotFound,
                                  "Method not supported by client: " + request.method);
    }
    auto sent = transport_->WriteLine(reply.dump());
    if (sent.IsErr()) {
        LogWarn(kComponent, "could not answer '" + request.method + "' from '" +
                                ServerName() + "': " + sent.Error().message);
    }
}

Error ClientSession::MakeError(ErrorCategory category,
                               const std::string& operation,
                               const std::string& message,
                               const std::string& tool) const {
    return Error::Make(category, operation, message, ServerName(), tool);
}

} // namespace toolmux
