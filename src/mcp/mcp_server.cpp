#include <toolmux/mcp/mcp_server.hpp>

#include <toolmux/core/log.hpp>
#include <toolmux/core/version.hpp>
#include <toolmux/mcp/json_rpc.hpp>

#include <optional>
#include <string>

namespace toolmux {

namespace {

constexpr const char* kComponent = "worker";

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     std::string server_name,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)),
      server_name_(std::move(server_name)),
      in_(in),
      out_(out) {}

void McpServer::Run() {
    LogInfo(kComponent, server_name_ + " serving " +
                            std::to_string(registry_.Tools().size()) + " tool(s)");
    std::string line;
    while (std::getline(in_, line)) {
        auto response = HandleLine(line);
        if (response) {
            out_ << response->dump() << "\n";
            out_.flush();
        }
    }
    LogInfo(kComponent, server_name_ + " input closed, exiting");
}

std::optional<nlohmann::json> McpServer::HandleLine(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return std::nullopt;
    }

    auto message = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (message.is_discarded()) {
        LogWarn(kComponent, "discarding unparsable line");
        return MakeErrorResponse(nullptr, rpc_code::kParseError, "Parse error");
    }
    return HandleMessage(message);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    auto decoded = DecodeRpcMessage(message);
    if (decoded.IsErr()) {
        nlohmann::json id = nullptr;
        if (message.is_object() && message.contains("id")) {
            id = message["id"];
        }
        return MakeErrorResponse(id, rpc_code::kInvalidRequest,
                                 decoded.Error().message);
    }

    const auto& msg = decoded.Value();
    if (msg.IsResponse()) {
        // This server never sends requests, so there is nothing to match.
        LogDebug(kComponent, "ignoring unsolicited response");
        return std::nullopt;
    }
    if (msg.IsNotification()) {
        LogDebug(kComponent, "notification: " + msg.method);
        return std::nullopt;
    }

    const auto& id = *msg.id;
    LogDebug(kComponent, "request: " + msg.method);

    if (msg.method == "initialize") {
        return HandleInitialize(id);
    }
    if (msg.method == "ping") {
        return MakeResultResponse(id, nlohmann::json::object());
    }
    if (msg.method == "tools/list") {
        return HandleToolsList(id);
    }
    if (msg.method == "tools/call") {
        return HandleToolsCall(msg.params, id);
    }
    return MakeErrorResponse(id, rpc_code::kMethodNotFound,
                             "Method not found: " + msg.method);
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& id) {
    initialized_ = true;

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", server_name_},
        {"version", kVersion}
    };

    return MakeResultResponse(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResultResponse(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") ||
        !params["name"].is_string()) {
        return MakeErrorResponse(id, rpc_code::kInvalidParams,
                                 "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }

    if (!registry_.HasTool(tool_name)) {
        return MakeErrorResponse(id, rpc_code::kInvalidParams,
                                 "Unknown tool: " + tool_name);
    }

    auto result = registry_.Execute(tool_name, arguments);

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
        LogDebug(kComponent, "tool '" + tool_name + "' reported an error");
    }

    return MakeResultResponse(id, response_result);
}

} // namespace toolmux
