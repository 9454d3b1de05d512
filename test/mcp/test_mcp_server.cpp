#include <catch2/catch_test_macros.hpp>

#include <toolmux/core/version.hpp>
#include <toolmux/mcp/mcp_server.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace toolmux;

namespace {

ToolRegistry MakeTestRegistry() {
    ToolRegistry registry;
    registry.Register("echo", "Echo the input",
        {{"type", "object"},
         {"properties", {{"message", {{"type", "string"}}}}},
         {"required", nlohmann::json::array({"message"})}},
        [](const nlohmann::json& args) {
            if (!args.contains("message")) {
                return ToolResult::Failure("Missing required argument 'message'");
            }
            return ToolResult::Text(args["message"].get<std::string>());
        });
    return registry;
}

nlohmann::json Request(int id, const std::string& method,
                       nlohmann::json params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

std::vector<nlohmann::json> ParseLines(const std::string& text) {
    std::vector<nlohmann::json> out;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        out.push_back(nlohmann::json::parse(line));
    }
    return out;
}

} // anonymous namespace

// ===========================================================================
// HandleMessage
// ===========================================================================

TEST_CASE("McpServer: initialize announces name and protocol", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), "echo-server", in, out);

    auto response = server.HandleMessage(
        Request(1, "initialize", {{"protocolVersion", kProtocolVersion}}));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == kProtocolVersion);
    CHECK(r["result"]["serverInfo"]["name"] == "echo-server");
    CHECK(r["result"]["serverInfo"]["version"] == kVersion);
    CHECK(r["result"]["capabilities"].contains("tools"));
    CHECK(server.IsInitialized());
}

TEST_CASE("McpServer: tools/list returns name, description, inputSchema", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), "echo-server", in, out);

    auto response = server.HandleMessage(Request(2, "tools/list"));
    REQUIRE(response.has_value());
    const auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.size() == 1);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[0]["description"] == "Echo the input");
    CHECK(tools[0]["inputSchema"]["required"][0] == "message");
}

TEST_CASE("McpServer: tools/call returns text content", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), "echo-server", in, out);

    auto response = server.HandleMessage(Request(3, "tools/call",
        {{"name", "echo"}, {"arguments", {{"message", "hi"}}}}));
    REQUIRE(response.has_value());
    const auto& result = (*response)["result"];
    CHECK(result["content"][0]["type"] == "text");
    CHECK(result["content"][0]["text"] == "hi");
    CHECK_FALSE(result.contains("isError"));
}

TEST_CASE("McpServer: tool failure sets isError", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), "echo-server", in, out);

    auto response = server.HandleMessage(Request(4, "tools/call", {{"name", "echo"}}));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["isError"] == true);
    CHECK((*response)["result"]["content"][0]["text"] ==
          "Missing required argument 'message'");
}

TEST_CASE("McpServer: unknown tool is an invalid-params error", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), "echo-server", in, out);

    auto response = server.HandleMessage(Request(5, "tools/call", {{"name", "nope"}}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
    CHECK((*response)["error"]["message"] == "Unknown tool: nope");
}

TEST_CASE("McpServer: tools/call without name", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), "echo-server", in, out);

    auto response = server.HandleMessage(Request(6, "tools/call"));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
}

TEST_CASE("McpServer: unknown method", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), "echo-server", in, out);

    auto response = server.HandleMessage(Request(7, "resources/list"));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32601);
}

TEST_CASE("McpServer: ping answers with an empty result", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), "echo-server", in, out);

    auto response = server.HandleMessage(Request(8, "ping"));
    REQUIRE(response.has_value());
    CHECK((*response)["result"] == nlohmann::json::object());
}

TEST_CASE("McpServer: notifications get no response", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), "echo-server", in, out);

    CHECK_FALSE(server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).has_value());
    CHECK_FALSE(server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"}}).has_value());
}

TEST_CASE("McpServer: wrong jsonrpc version is an invalid request", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), "echo-server", in, out);

    auto response = server.HandleMessage(
        {{"jsonrpc", "1.0"}, {"id", 9}, {"method", "tools/list"}});
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == 9);
    CHECK((*response)["error"]["code"] == -32600);
}

// ===========================================================================
// HandleLine / Run
// ===========================================================================

TEST_CASE("McpServer: unparsable line is a parse error with null id", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), "echo-server", in, out);

    auto response = server.HandleLine("{not json");
    REQUIRE(response.has_value());
    CHECK((*response)["id"].is_null());
    CHECK((*response)["error"]["code"] == -32700);

    CHECK_FALSE(server.HandleLine("").has_value());
    CHECK_FALSE(server.HandleLine("\r").has_value());
}

TEST_CASE("McpServer: Run answers each request line until EOF", "[mcp][server]") {
    std::string script =
        Request(1, "initialize").dump() + "\n" +
        nlohmann::json({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).dump() + "\n" +
        "\n" +
        Request(2, "tools/list").dump() + "\n" +
        Request(3, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "x"}}}}).dump() + "\n";

    std::istringstream in(script);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), "echo-server", in, out);
    server.Run();

    auto responses = ParseLines(out.str());
    REQUIRE(responses.size() == 3);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[2]["id"] == 3);
    CHECK(responses[2]["result"]["content"][0]["text"] == "x");
}
