#pragma once

#include <toolmux/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolmux {

// ---------------------------------------------------------------------------
// McpServer: serves a ToolRegistry over stdin/stdout, one JSON-RPC 2.0
// message per line.
//
//   - initialize
//   - notifications/initialized (notification, no response)
//   - ping
//   - tools/list
//   - tools/call
//
// Other notifications are ignored. Nothing but protocol frames is written to
// the output stream.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::string server_name = "toolmux-worker",
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Process one raw line. Returns nullopt when nothing is to be sent back.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(std::string_view line);

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);

    ToolRegistry registry_;
    std::string server_name_;
    std::istream& in_;
    std::ostream& out_;
    bool initialized_ = false;
};

} // namespace toolmux
