#include <toolmux/coordinator/coordinator.hpp>

#include <toolmux/core/log.hpp>
#include <toolmux/process/worker_process.hpp>

namespace toolmux {

namespace {

constexpr const char* kComponent = "coordinator";

} // anonymous namespace

TransportFactory MakeProcessTransportFactory(std::chrono::milliseconds shutdown_grace) {
    return [shutdown_grace](const WorkerConfig& config)
               -> Result<std::shared_ptr<IWorkerTransport>, Error> {
        return WorkerProcess::Launch(config, shutdown_grace)
            .Map([](std::unique_ptr<WorkerProcess> process) {
                return std::shared_ptr<IWorkerTransport>(std::move(process));
            });
    };
}

Coordinator::Coordinator(CoordinatorOptions options)
    : Coordinator(options, MakeProcessTransportFactory(options.shutdown_grace)) {}

Coordinator::Coordinator(CoordinatorOptions options, TransportFactory factory)
    : options_(options), factory_(std::move(factory)) {}

Coordinator::~Coordinator() {
    Close();
}

// ---------------------------------------------------------------------------
// Scope
// ---------------------------------------------------------------------------
void Coordinator::Open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!scope_) {
        scope_ = std::make_unique<ResourceScope>();
        LogDebug(kComponent, "scope opened");
    }
}

std::vector<Error> Coordinator::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto failures = DisconnectLocked();
    if (!scope_) {
        return failures;
    }

    // Whatever is left belongs to workers replaced by AddServer().
    auto remaining = scope_->Close();
    failures.insert(failures.end(), std::make_move_iterator(remaining.begin()),
                    std::make_move_iterator(remaining.end()));
    scope_.reset();

    if (failures.empty()) {
        LogDebug(kComponent, "scope closed");
    } else {
        LogWarn(kComponent, "scope closed with " + std::to_string(failures.size()) +
                                " cleanup failure(s)");
    }
    return failures;
}

bool Coordinator::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scope_ != nullptr;
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------
void Coordinator::AddServer(WorkerConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string name = config.name;
    auto previous = connections_.Upsert(std::move(config));
    if (previous && previous->IsConnected()) {
        LogWarn(kComponent, "worker '" + name +
                                "' re-registered while connected; its tools now "
                                "route to an unconnected entry");
    }
    LogDebug(kComponent, "registered worker '" + name + "'");
}

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------
Result<void, Error> Coordinator::ConnectToServer(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ConnectLocked(name);
}

Result<void, Error> Coordinator::ConnectAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto open = RequireOpen("ConnectAll");
    if (open.IsErr()) {
        return open;
    }

    const auto names = connections_.Names();
    for (const auto& name : names) {
        auto connected = ConnectLocked(name);
        if (connected.IsErr()) {
            LogError(kComponent, "connect aborted at '" + name + "': " +
                                     connected.Error().ToString());
            return connected;
        }
    }
    LogInfo(kComponent, "connected " + std::to_string(names.size()) +
                            " worker(s), " + std::to_string(router_.Size()) +
                            " tool(s) routed");
    return Result<void, Error>::Ok();
}

Result<void, Error> Coordinator::ConnectLocked(const std::string& name) {
    auto open = RequireOpen("ConnectToServer", name);
    if (open.IsErr()) {
        return open;
    }

    auto* conn = connections_.Find(name);
    if (conn == nullptr) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::UnknownServer, "ConnectToServer",
            "no worker registered under this name", name));
    }
    if (conn->IsConnected()) {
        LogDebug(kComponent, "worker '" + name + "' already connected");
        return Result<void, Error>::Ok();
    }

    auto started = factory_(conn->config);
    if (started.IsErr()) {
        return Result<void, Error>::Err(std::move(started).Error());
    }
    std::shared_ptr<IWorkerTransport> transport = std::move(started).Value();

    // Owned by the scope from here on, whatever happens next.
    const auto token = scope_->Defer("worker '" + name + "'",
                                     [transport] { return transport->Terminate(); });

    auto fail = [&](Error error) {
        if (auto cleanup = scope_->Release(token)) {
            LogWarn(kComponent, "cleanup after failed connect to '" + name +
                                    "': " + cleanup->ToString());
        }
        return Result<void, Error>::Err(std::move(error));
    };

    auto session = std::make_shared<ClientSession>(transport, options_.session);
    auto initialized = session->Initialize();
    if (initialized.IsErr()) {
        return fail(std::move(initialized).Error());
    }

    auto tools = session->ListTools();
    if (tools.IsErr()) {
        return fail(std::move(tools).Error());
    }

    conn->session = std::move(session);
    conn->tools = std::move(tools).Value();
    conn->scope_token = token;

    // Bindings left over from a replaced registration of this name.
    if (auto stale = router_.UnbindServer(name)) {
        LogDebug(kComponent, "dropped " + std::to_string(stale) +
                                 " stale route(s) of worker '" + name + "'");
    }

    for (const auto& tool : conn->tools) {
        if (auto shadowed = router_.Bind(tool.name, name)) {
            LogWarn(kComponent, "tool '" + tool.name + "' of worker '" + *shadowed +
                                    "' is shadowed by worker '" + name + "'");
        }
    }

    LogInfo(kComponent, "worker '" + name + "' connected with " +
                            std::to_string(conn->tools.size()) + " tool(s)");
    return Result<void, Error>::Ok();
}

std::vector<Error> Coordinator::DisconnectAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    return DisconnectLocked();
}

std::vector<Error> Coordinator::DisconnectLocked() {
    std::vector<Error> failures;
    const auto& names = connections_.Names();

    // Reverse registration order approximates reverse acquisition order.
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        auto* conn = connections_.Find(*it);
        if (conn == nullptr) {
            continue;
        }
        conn->session.reset();
        conn->tools.clear();
        if (conn->scope_token && scope_) {
            if (auto error = scope_->Release(*conn->scope_token)) {
                LogWarn(kComponent, "terminating worker '" + *it + "' failed: " +
                                        error->ToString());
                failures.push_back(std::move(*error));
            }
        }
        conn->scope_token.reset();
    }
    router_.Clear();
    return failures;
}

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------
std::vector<ToolInfo> Coordinator::ListAllTools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return router_.ListAll(connections_);
}

Result<std::string, Error> Coordinator::CallTool(const std::string& name,
                                                 const nlohmann::json& arguments) {
    using R = Result<std::string, Error>;

    std::shared_ptr<ClientSession> session;
    std::string server;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto open = RequireOpen("CallTool", "", name);
        if (open.IsErr()) {
            return R::Err(std::move(open).Error());
        }

        auto owner = router_.Resolve(name);
        if (owner.IsErr()) {
            return R::Err(std::move(owner).Error());
        }
        server = std::move(owner).Value();

        const auto* conn = connections_.Find(server);
        if (conn == nullptr || !conn->IsConnected()) {
            return R::Err(Error::Make(ErrorCategory::NotConnected, "CallTool",
                                      "Not connected to server '" + server + "'",
                                      server, name));
        }
        session = conn->session;
    }

    // Session I/O runs outside the coordinator lock.
    LogDebug(kComponent, "routing '" + name + "' to '" + server + "'");
    return session->CallTool(name, arguments);
}

// ---------------------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------------------
std::vector<std::string> Coordinator::ServerNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.Names();
}

std::optional<WorkerConfig> Coordinator::ServerConfig(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* conn = connections_.Find(name);
    if (conn == nullptr) {
        return std::nullopt;
    }
    return conn->config;
}

bool Coordinator::IsConnected(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* conn = connections_.Find(name);
    return conn != nullptr && conn->IsConnected();
}

std::vector<ToolDescriptor> Coordinator::ServerTools(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* conn = connections_.Find(name);
    if (conn == nullptr) {
        return {};
    }
    return conn->tools;
}

std::size_t Coordinator::RoutedToolCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return router_.Size();
}

Result<std::string, Error> Coordinator::ResolveTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return router_.Resolve(name);
}

Result<void, Error> Coordinator::RequireOpen(const std::string& operation,
                                             const std::string& server,
                                             const std::string& tool) const {
    if (scope_) {
        return Result<void, Error>::Ok();
    }
    return Result<void, Error>::Err(Error::Make(
        ErrorCategory::NotInitialized, operation,
        "coordinator is not open; call Open() first", server, tool));
}

} // namespace toolmux
