#pragma once

#include <toolmux/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolmux {

constexpr const char* kJsonRpcVersion = "2.0";

// Standard JSON-RPC 2.0 error codes.
namespace rpc_code {
constexpr int kParseError     = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kInternalError  = -32603;
} // namespace rpc_code

struct RpcError {
    int code = rpc_code::kInternalError;
    std::string message;
};

// ---------------------------------------------------------------------------
// RpcMessage: one decoded frame: a request, a notification or a response.
// ---------------------------------------------------------------------------
struct RpcMessage {
    std::optional<nlohmann::json> id;
    std::string method;                      // empty for responses
    nlohmann::json params = nlohmann::json::object();
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    [[nodiscard]] bool IsRequest() const { return !method.empty() && id.has_value(); }
    [[nodiscard]] bool IsNotification() const { return !method.empty() && !id.has_value(); }
    [[nodiscard]] bool IsResponse() const { return method.empty(); }
};

nlohmann::json MakeRequest(std::int64_t id, std::string_view method,
                           const nlohmann::json& params);
nlohmann::json MakeNotification(std::string_view method,
                                const nlohmann::json& params = nlohmann::json::object());
nlohmann::json MakeResultResponse(const nlohmann::json& id,
                                  const nlohmann::json& result);
nlohmann::json MakeErrorResponse(const nlohmann::json& id, int code,
                                 const std::string& message);

// Decode and validate one line. Malformed input yields a Protocol error.
Result<RpcMessage, Error> ParseRpcMessage(std::string_view line);

// Validate an already parsed document.
Result<RpcMessage, Error> DecodeRpcMessage(const nlohmann::json& doc);

} // namespace toolmux
