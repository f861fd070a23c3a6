#include "tessera/registry.hpp"
#include "tessera/log.hpp"
#include "tessera/path.hpp"

namespace tessera {

std::shared_ptr<database> connection_registry::acquire(const connection_config& config) {
    auto path = resolve_path(config.name);

    if (!is_shared_memory_name(config.name)) {
        return std::make_shared<database>(path, config.mode);
    }

    // Lookup-or-create under one lock so concurrent first uses open a single handle
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(config.name);
    if (it != connections_.end()) {
        LOG_DEBUG("registry", "Reusing shared connection for %s", config.name.c_str());
        return it->second;
    }

    auto db = std::make_shared<database>(path, config.mode);
    connections_.emplace(config.name, db);
    LOG_DEBUG("registry", "Registered shared connection for %s", config.name.c_str());
    return db;
}

} // namespace tessera
