#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <unordered_map>
#include <unordered_set>

namespace tessera {

/// Per-table set of record ids whose rows the caller already holds in memory.
///
/// Only an optimization: a missing entry makes reads return the full row
/// instead of the bare id, it never changes which rows a read returns.
/// Not synchronized; the owning driver mutates it while holding its
/// connection's lock.
class record_cache {
public:
    bool is_cached(const std::string& table, const record_id_t& id) const;

    /// Idempotent.
    void mark_as_cached(const std::string& table, const record_id_t& id);

    /// No-op if the table or id is unknown.
    void remove_from_cache(const std::string& table, const record_id_t& id);

    /// Forget every table (full reset).
    void clear();

    /// Number of cached ids for table.
    std::size_t size(const std::string& table) const;

    /// Number of cached ids across all tables.
    std::size_t size() const;

private:
    // Table sets are created on first insert and only dropped by clear()
    std::unordered_map<std::string, std::unordered_set<record_id_t>> tables_;
};

} // namespace tessera

#endif // __cplusplus
