#pragma once

#include <toolmux/coordinator/connection_registry.hpp>
#include <toolmux/coordinator/tool_router.hpp>
#include <toolmux/core/resource_scope.hpp>
#include <toolmux/core/result.hpp>
#include <toolmux/core/types.hpp>
#include <toolmux/process/i_worker_transport.hpp>
#include <toolmux/session/client_session.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolmux {

struct CoordinatorOptions {
    SessionOptions session;
    std::chrono::milliseconds shutdown_grace{2000};
};

// Starts the channel for one worker. The default launches a WorkerProcess;
// tests substitute scripted transports.
using TransportFactory = std::function<
    Result<std::shared_ptr<IWorkerTransport>, Error>(const WorkerConfig&)>;

TransportFactory MakeProcessTransportFactory(std::chrono::milliseconds shutdown_grace);

// ---------------------------------------------------------------------------
// Coordinator: registers workers, connects to them, merges their catalogs
// and routes tool calls.
//
// Connect and call operations require an open scope:
//
//   Coordinator coordinator;
//   coordinator.Open();
//   coordinator.AddServer({"math", "/usr/bin/toolmux-worker", {"--toolset", "math"}});
//   auto connected = coordinator.ConnectAll();
//   auto sum = coordinator.CallTool("add", {{"a", 5}, {"b", 3}});   // "8"
//   coordinator.Close();   // also run by the destructor
//
// Every worker launched while open is owned by the scope and terminated on
// Close(), whatever happened in between. Connects run sequentially in
// registration order; a failure stops ConnectAll() but leaves workers that
// already connected in place. Nothing is retried.
// ---------------------------------------------------------------------------
class Coordinator {
public:
    explicit Coordinator(CoordinatorOptions options = {});
    Coordinator(CoordinatorOptions options, TransportFactory factory);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;
    Coordinator(Coordinator&&) = delete;
    Coordinator& operator=(Coordinator&&) = delete;

    // -- Scope ---------------------------------------------------------------

    // Enter the scope. Calling Open() while already open is a no-op.
    void Open();

    // Disconnect everything and release the scope. Termination failures are
    // logged and returned, never raised. Safe to call repeatedly.
    std::vector<Error> Close();

    [[nodiscard]] bool IsOpen() const;

    // -- Registration --------------------------------------------------------

    // Insert or replace the worker named config.name. No I/O. A replaced
    // worker's live process stays owned by the scope until Close().
    void AddServer(WorkerConfig config);

    // -- Connection ----------------------------------------------------------

    [[nodiscard]] Result<void, Error> ConnectToServer(const std::string& name);
    [[nodiscard]] Result<void, Error> ConnectAll();

    // Drop every session, terminate its worker and clear the routing table.
    // Failures are logged and returned.
    std::vector<Error> DisconnectAll();

    // -- Tools ---------------------------------------------------------------

    [[nodiscard]] std::vector<ToolInfo> ListAllTools() const;

    [[nodiscard]] Result<std::string, Error> CallTool(
        const std::string& name, const nlohmann::json& arguments);

    // -- Introspection -------------------------------------------------------

    [[nodiscard]] std::vector<std::string> ServerNames() const;
    [[nodiscard]] std::optional<WorkerConfig> ServerConfig(const std::string& name) const;
    [[nodiscard]] bool IsConnected(const std::string& name) const;
    [[nodiscard]] std::vector<ToolDescriptor> ServerTools(const std::string& name) const;
    [[nodiscard]] std::size_t RoutedToolCount() const;
    [[nodiscard]] Result<std::string, Error> ResolveTool(const std::string& name) const;

private:
    Result<void, Error> ConnectLocked(const std::string& name);
    std::vector<Error> DisconnectLocked();
    Result<void, Error> RequireOpen(const std::string& operation,
                                    const std::string& server = "",
                                    const std::string& tool = "") const;

    CoordinatorOptions options_;
    TransportFactory factory_;

    mutable std::mutex mutex_;  // single writer over the fields below
    ConnectionRegistry connections_;
    ToolRouter router_;
    std::unique_ptr<ResourceScope> scope_;  // non-null while open
};

} // namespace toolmux
