#include <toolmux/coordinator/tool_router.hpp>

namespace toolmux {

std::optional<std::string> ToolRouter::Bind(const std::string& tool,
                                            const std::string& server) {
    auto it = owners_.find(tool);
    if (it == owners_.end()) {
        owners_.emplace(tool, server);
        return std::nullopt;
    }
    std::optional<std::string> previous;
    if (it->second != server) {
        previous = it->second;
    }
    it->second = server;
    return previous;
}

std::size_t ToolRouter::UnbindServer(const std::string& server) {
    std::size_t removed = 0;
    for (auto it = owners_.begin(); it != owners_.end();) {
        if (it->second == server) {
            it = owners_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

Result<std::string, Error> ToolRouter::Resolve(const std::string& tool) const {
    auto it = owners_.find(tool);
    if (it == owners_.end()) {
        return Result<std::string, Error>::Err(Error::Make(
            ErrorCategory::ToolNotFound, "CallTool",
            "Tool '" + tool + "' not found in any server", "", tool));
    }
    return Result<std::string, Error>::Ok(it->second);
}

std::vector<ToolInfo> ToolRouter::ListAll(const ConnectionRegistry& connections) const {
    std::vector<ToolInfo> all;
    for (const auto& name : connections.Names()) {
        const auto* conn = connections.Find(name);
        if (conn == nullptr) {
            continue;
        }
        for (const auto& tool : conn->tools) {
            all.push_back(ToolInfo{tool.name, tool.description,
                                   tool.input_schema, conn->config.name});
        }
    }
    return all;
}

} // namespace toolmux
