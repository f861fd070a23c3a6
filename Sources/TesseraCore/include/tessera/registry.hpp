#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace tessera {

struct connection_config {
    /// Logical database name, resolved with resolve_path().
    std::string name = ":memory:";

    database::open_mode mode = database::open_mode::read_write;

    connection_config() = default;

    explicit connection_config(const std::string& n) : name(n) {}

    connection_config(const std::string& n, database::open_mode m) : name(n), mode(m) {}
};

/// Process-wide map from logical name to open connection.
///
/// Shared-memory names ("...?mode=memory&cache=shared") resolve to exactly one
/// handle per name: the first acquire() opens it, later ones return the same
/// pointer, and the registry keeps it alive for the rest of the process so the
/// in-memory contents survive drivers coming and going. Every other name gets
/// a fresh connection that only the caller owns.
class connection_registry {
public:
    connection_registry() = default;

    connection_registry(const connection_registry&) = delete;
    connection_registry& operator=(const connection_registry&) = delete;

    // Singleton accessor - defined in tessera.cpp to avoid ODR violations
    static connection_registry& shared();

    std::shared_ptr<database> acquire(const connection_config& config);

    /// Number of registered shared-memory handles.
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<database>> connections_;
};

} // namespace tessera

#endif // __cplusplus
