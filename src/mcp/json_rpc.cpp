#include <toolmux/mcp/json_rpc.hpp>

#include <cstdint>
#include <limits>

namespace toolmux {

namespace {

Result<RpcMessage, Error> Malformed(const std::string& message) {
    return Result<RpcMessage, Error>::Err(
        Error::Make(ErrorCategory::Protocol, "ParseRpcMessage", message));
}

bool IsValidId(const nlohmann::json& id) {
    return id.is_null() || id.is_string() || id.is_number_integer() ||
           id.is_number_unsigned();
}

} // anonymous namespace

nlohmann::json MakeRequest(std::int64_t id, std::string_view method,
                           const nlohmann::json& params) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"method", std::string(method)},
        {"params", params}
    };
}

nlohmann::json MakeNotification(std::string_view method,
                                const nlohmann::json& params) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"method", std::string(method)},
        {"params", params}
    };
}

nlohmann::json MakeResultResponse(const nlohmann::json& id,
                                  const nlohmann::json& result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeErrorResponse(const nlohmann::json& id, int code,
                                 const std::string& message) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

Result<RpcMessage, Error> ParseRpcMessage(std::string_view line) {
    auto doc = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (doc.is_discarded()) {
        return Malformed("not valid JSON: " + std::string(line.substr(0, 200)));
    }
    return DecodeRpcMessage(doc);
}

Result<RpcMessage, Error> DecodeRpcMessage(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return Malformed("message is not a JSON object");
    }

    auto version = doc.find("jsonrpc");
    if (version == doc.end() || !version->is_string() || *version != kJsonRpcVersion) {
        return Malformed("jsonrpc must be \"2.0\"");
    }

    RpcMessage msg;

    auto id = doc.find("id");
    if (id != doc.end()) {
        if (!IsValidId(*id)) {
            return Malformed("id must be a string, an integer or null");
        }
        msg.id = *id;
    }

    auto method = doc.find("method");
    if (method != doc.end()) {
        if (!method->is_string() || method->get<std::string>().empty()) {
            return Malformed("method must be a non-empty string");
        }
        msg.method = method->get<std::string>();
        auto params = doc.find("params");
        if (params != doc.end()) {
            if (!params->is_object() && !params->is_array()) {
                return Malformed("params must be an object or an array");
            }
            msg.params = *params;
        }
        return Result<RpcMessage, Error>::Ok(std::move(msg));
    }

    // Response: exactly one of result / error.
    if (!msg.id.has_value()) {
        return Malformed("response has no id");
    }
    const bool has_result = doc.contains("result");
    const bool has_error = doc.contains("error");
    if (has_result == has_error) {
        return Malformed("response must carry exactly one of result or error");
    }
    if (has_result) {
        msg.result = doc["result"];
    } else {
        const auto& err = doc["error"];
        if (!err.is_object() || !err.contains("code") ||
            !err["code"].is_number_integer()) {
            return Malformed("error object must carry an integer code");
        }
        const auto& code = err["code"];
        const bool fits = code.is_number_unsigned()
            ? code.get<std::uint64_t>() <=
                  static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : code.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                  code.get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!fits) {
            return Malformed("error code out of range: " + code.dump());
        }
        RpcError rpc_error;
        rpc_error.code = code.get<int>();
        if (err.contains("message") && err["message"].is_string()) {
            rpc_error.message = err["message"].get<std::string>();
        }
        msg.error = std::move(rpc_error);
    }
    return Result<RpcMessage, Error>::Ok(std::move(msg));
}

} // namespace toolmux
