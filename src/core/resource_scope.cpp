#include <toolmux/core/resource_scope.hpp>

#include <toolmux/core/log.hpp>

#include <algorithm>
#include <exception>

namespace toolmux {

ResourceScope::~ResourceScope() {
    Close();
}

ResourceScope::Token ResourceScope::Defer(std::string label, Cleanup cleanup) {
    const Token token = next_token_++;
    entries_.push_back(Entry{token, std::move(label), std::move(cleanup)});
    return token;
}

std::optional<Error> ResourceScope::Release(Token token) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [token](const Entry& e) { return e.token == token; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    Entry entry = std::move(*it);
    entries_.erase(it);
    return Run(entry);
}

std::vector<Error> ResourceScope::Close() {
    std::vector<Error> failures;
    // Pop one at a time so an action that touches the scope sees a
    // consistent list.
    while (!entries_.empty()) {
        Entry entry = std::move(entries_.back());
        entries_.pop_back();
        if (auto error = Run(entry)) {
            LogWarn("scope", "cleanup of " + entry.label + " failed: " +
                                 error->ToString());
            failures.push_back(std::move(*error));
        }
    }
    return failures;
}

std::optional<Error> ResourceScope::Run(Entry& entry) {
    if (!entry.cleanup) {
        return std::nullopt;
    }
    try {
        auto result = entry.cleanup();
        if (result.IsOk()) {
            LogDebug("scope", "released " + entry.label);
            return std::nullopt;
        }
        return std::move(result).Error();
    } catch (const std::exception& e) {
        return Error::Make(ErrorCategory::Internal, "ResourceScope",
                           "cleanup of " + entry.label + " threw: " + e.what());
    }
}

} // namespace toolmux
