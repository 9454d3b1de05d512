#pragma once

#include <toolmux/core/resource_scope.hpp>
#include <toolmux/core/types.hpp>
#include <toolmux/session/client_session.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolmux {

// ---------------------------------------------------------------------------
// Connection: one registered worker and what the coordinator knows of it.
//
// `session` and `tools` stay empty until a connect succeeds and are reset on
// disconnect. `scope_token` identifies the worker's cleanup action in the
// coordinator's ResourceScope.
// ---------------------------------------------------------------------------
struct Connection {
    WorkerConfig config;
    std::shared_ptr<ClientSession> session;
    std::vector<ToolDescriptor> tools;
    std::optional<ResourceScope::Token> scope_token;

    [[nodiscard]] bool IsConnected() const noexcept { return session != nullptr; }
};

// ---------------------------------------------------------------------------
// ConnectionRegistry: worker name → Connection, iterated in the order the
// names were first registered.
// ---------------------------------------------------------------------------
class ConnectionRegistry {
public:
    // Store a fresh, unconnected entry for config.name. Replacing an existing
    // name keeps its position and returns the entry it replaced.
    std::optional<Connection> Upsert(WorkerConfig config);

    [[nodiscard]] Connection* Find(const std::string& name);
    [[nodiscard]] const Connection* Find(const std::string& name) const;

    [[nodiscard]] bool Contains(const std::string& name) const {
        return connections_.count(name) > 0;
    }

    // Registration order.
    [[nodiscard]] const std::vector<std::string>& Names() const noexcept {
        return order_;
    }

    [[nodiscard]] std::size_t Size() const noexcept { return order_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return order_.empty(); }

private:
    std::vector<std::string> order_;
    std::map<std::string, Connection> connections_;
};

} // namespace toolmux
