#include "tessera/record_cache.hpp"

namespace tessera {

bool record_cache::is_cached(const std::string& table, const record_id_t& id) const {
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return false;
    }
    return it->second.count(id) > 0;
}

void record_cache::mark_as_cached(const std::string& table, const record_id_t& id) {
    tables_[table].insert(id);
}

void record_cache::remove_from_cache(const std::string& table, const record_id_t& id) {
    auto it = tables_.find(table);
    if (it != tables_.end()) {
        it->second.erase(id);
    }
}

void record_cache::clear() {
    tables_.clear();
}

std::size_t record_cache::size(const std::string& table) const {
    auto it = tables_.find(table);
    return it == tables_.end() ? 0 : it->second.size();
}

std::size_t record_cache::size() const {
    std::size_t total = 0;
    for (const auto& [_, ids] : tables_) {
        total += ids.size();
    }
    return total;
}

} // namespace tessera
