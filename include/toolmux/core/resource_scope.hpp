#pragma once

#include <toolmux/core/result.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace toolmux {

// ---------------------------------------------------------------------------
// ResourceScope: structured teardown for acquired resources.
//
// Cleanup actions are registered in acquisition order and run in reverse on
// Close() (or destruction). A failing action never stops the remaining ones;
// failures are collected, logged at WARN, and returned to the caller.
//
// Usage:
//   ResourceScope scope;
//   auto token = scope.Defer("worker math", [proc] { return proc->Terminate(); });
//   ...
//   scope.Release(token);   // run one action early
//   auto failures = scope.Close();
// ---------------------------------------------------------------------------
class ResourceScope {
public:
    using Token = std::uint64_t;
    using Cleanup = std::function<Result<void, Error>()>;

    ResourceScope() = default;
    ~ResourceScope();

    ResourceScope(const ResourceScope&) = delete;
    ResourceScope& operator=(const ResourceScope&) = delete;
    ResourceScope(ResourceScope&&) = delete;
    ResourceScope& operator=(ResourceScope&&) = delete;

    // Register a cleanup action. The returned token identifies it for Release.
    Token Defer(std::string label, Cleanup cleanup);

    // Run a single action now and forget it. Returns the action's error, if
    // any. Unknown or already-released tokens are a no-op.
    std::optional<Error> Release(Token token);

    // Run every pending action in reverse registration order.
    std::vector<Error> Close();

    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return entries_.empty(); }

private:
    struct Entry {
        Token token;
        std::string label;
        Cleanup cleanup;
    };

    static std::optional<Error> Run(Entry& entry);

    std::vector<Entry> entries_;
    Token next_token_ = 1;
};

} // namespace toolmux
