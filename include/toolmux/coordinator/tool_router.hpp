#pragma once

#include <toolmux/coordinator/connection_registry.hpp>
#include <toolmux/core/result.hpp>
#include <toolmux/core/types.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolmux {

// ---------------------------------------------------------------------------
// ToolRouter: flat tool name → owning worker name map.
//
// Names are global across workers. When two workers offer the same tool the
// one bound last wins; the earlier owner is silently shadowed. Callers that
// care should log the previous owner that Bind() returns.
// ---------------------------------------------------------------------------
class ToolRouter {
public:
    // Bind a tool to a worker. Returns the previous owner when the name was
    // already bound to a different worker.
    std::optional<std::string> Bind(const std::string& tool,
                                     const std::string& server);

    // Drop every binding owned by `server`. Returns how many were removed.
    std::size_t UnbindServer(const std::string& server);

    [[nodiscard]] Result<std::string, Error> Resolve(const std::string& tool) const;

    // Every tool of every connection with a discovered catalog, in
    // registration order and then discovery order.
    [[nodiscard]] std::vector<ToolInfo> ListAll(
        const ConnectionRegistry& connections) const;

    [[nodiscard]] std::size_t Size() const noexcept { return owners_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return owners_.empty(); }
    void Clear() noexcept { owners_.clear(); }

private:
    std::map<std::string, std::string> owners_;
};

} // namespace toolmux
