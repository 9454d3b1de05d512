#include <toolmux/coordinator/connection_registry.hpp>

namespace toolmux {

std::optional<Connection> ConnectionRegistry::Upsert(WorkerConfig config) {
    const std::string name = config.name;
    Connection fresh;
    fresh.config = std::move(config);

    auto it = connections_.find(name);
    if (it == connections_.end()) {
        order_.push_back(name);
        connections_.emplace(name, std::move(fresh));
        return std::nullopt;
    }

    Connection previous = std::move(it->second);
    it->second = std::move(fresh);
    return previous;
}

Connection* ConnectionRegistry::Find(const std::string& name) {
    auto it = connections_.find(name);
    return it == connections_.end() ? nullptr : &it->second;
}

const Connection* ConnectionRegistry::Find(const std::string& name) const {
    auto it = connections_.find(name);
    return it == connections_.end() ? nullptr : &it->second;
}

} // namespace toolmux
