#include "tessera/driver.hpp"
#include "tessera/log.hpp"
#include <algorithm>
#include <sstream>

namespace tessera {

namespace {

// Largest IN (...) list issued per statement by destroy_deleted_records
constexpr std::size_t delete_chunk_size = 500;

std::string quote_identifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

record_id_t row_id(const row_t& row) {
    auto it = row.find("id");
    if (it == row.end()) {
        throw db_error("Query result has no id column");
    }
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        return *text;
    }
    if (const auto* integer = std::get_if<int64_t>(&it->second)) {
        return std::to_string(*integer);
    }
    throw db_error("Query result id column is neither text nor integer");
}

} // namespace

std::string describe(const driver_failure& failure) {
    return std::visit([](auto&& f) -> std::string {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, migration_needed>) {
            return "Migration needed: database is at version " + std::to_string(f.database_version);
        } else if constexpr (std::is_same_v<T, schema_needed>) {
            return "Schema needed: database is at version " + std::to_string(f.database_version);
        } else if constexpr (std::is_same_v<T, incompatible_migration>) {
            return "Incompatible migration set applied. DB: " + std::to_string(f.database_version) +
                   ", migration: " + std::to_string(f.migration_from);
        } else {
            return "Unknown batch operation: " + f.tag;
        }
    }, failure);
}

driver::driver(connection_registry& registry) : registry_(registry) {
    init_log_level_from_env();
}

database& driver::db() {
    if (!db_) {
        throw db_error("Driver is not open", SQLITE_MISUSE);
    }
    return *db_;
}

// MARK: Setup

void driver::open(const connection_config& config) {
    db_ = registry_.acquire(config);
    cache_.clear();
    LOG_INFO("driver", "Opened %s at %s", config.name.c_str(), db_->path().c_str());
}

void driver::initialize(const std::string& name, int32_t schema_version) {
    open(connection_config(name));
    is_compatible(schema_version);
}

void driver::set_up_with_schema(const std::string& name, const std::string& schema_sql,
                                int32_t schema_version) {
    open(connection_config(name));
    unsafe_reset_database({schema_sql, schema_version});
    is_compatible(schema_version);
}

void driver::set_up_with_migrations(const std::string& name, const migration& step) {
    open(connection_config(name));
    migrate(step);
    is_compatible(step.to);
}

// MARK: Schema gate

compatibility driver::check_compatibility(int32_t expected_version) {
    int32_t version = db().user_version();
    if (version == expected_version) {
        return compatible{};
    }
    if (version > 0 && version < expected_version) {
        return migration_needed{version};
    }
    return schema_needed{version};
}

void driver::is_compatible(int32_t expected_version) {
    auto result = check_compatibility(expected_version);
    if (const auto* needed = std::get_if<migration_needed>(&result)) {
        LOG_WARN("driver", "Database at version %d, expected %d: migration needed",
                 needed->database_version, expected_version);
        throw driver_error(*needed);
    }
    if (const auto* needed = std::get_if<schema_needed>(&result)) {
        LOG_WARN("driver", "Database at version %d, expected %d: schema needed",
                 needed->database_version, expected_version);
        throw driver_error(*needed);
    }
}

void driver::set_up_schema(const schema& definition) {
    auto& conn = db();
    conn.in_transaction([&] {
        conn.execute_statements(definition.sql + ";\n" + local_storage_schema);
        conn.set_user_version(definition.version);
    });
    LOG_INFO("driver", "Set up schema version %d", definition.version);
}

void driver::migrate(const migration& step) {
    auto& conn = db();
    std::lock_guard<std::recursive_mutex> lock(conn.mutex());

    int32_t version = conn.user_version();
    if (version != step.from) {
        LOG_ERROR("driver", "Incompatible migration set applied. DB: %d, migration: %d",
                  version, step.from);
        throw driver_error(incompatible_migration{version, step.from});
    }

    conn.in_transaction([&] {
        conn.execute_statements(step.sql);
        conn.set_user_version(step.to);
    });
    LOG_INFO("driver", "Migrated from version %d to %d", step.from, step.to);
}

void driver::unsafe_reset_database(const schema& definition) {
    auto& conn = db();
    std::lock_guard<std::recursive_mutex> lock(conn.mutex());

    LOG_INFO("driver", "Resetting %s", conn.path().c_str());
    conn.unsafe_destroy_everything();
    cache_.clear();
    set_up_schema(definition);
}

int32_t driver::schema_version() {
    return db().user_version();
}

// MARK: Queries

std::optional<cached_entry_t> driver::find(const std::string& table, const record_id_t& id) {
    auto& conn = db();
    std::lock_guard<std::recursive_mutex> lock(conn.mutex());

    if (cache_.is_cached(table, id)) {
        return cached_entry_t{id};
    }

    auto rows = conn.query("SELECT * FROM " + quote_identifier(table) + " WHERE id == ? LIMIT 1",
                           positional_args_t{id});
    if (rows.empty()) {
        return std::nullopt;
    }

    cache_.mark_as_cached(table, id);
    return cached_entry_t{std::move(rows.front())};
}

std::vector<cached_entry_t> driver::cached_query(const std::string& table, const std::string& sql,
                                                 const positional_args_t& args) {
    auto& conn = db();
    std::lock_guard<std::recursive_mutex> lock(conn.mutex());

    auto rows = conn.query(sql, args);

    std::vector<cached_entry_t> results;
    results.reserve(rows.size());
    for (auto& row : rows) {
        auto id = row_id(row);
        if (cache_.is_cached(table, id)) {
            results.emplace_back(std::move(id));
        } else {
            cache_.mark_as_cached(table, id);
            results.emplace_back(std::move(row));
        }
    }
    return results;
}

std::vector<record_id_t> driver::query_ids(const std::string& sql, const positional_args_t& args) {
    auto rows = db().query(sql, args);

    std::vector<record_id_t> ids;
    ids.reserve(rows.size());
    for (const auto& row : rows) {
        ids.push_back(row_id(row));
    }
    return ids;
}

int64_t driver::count(const std::string& sql, const positional_args_t& args) {
    return db().count(sql, args);
}

// MARK: Batches

void driver::batch(const std::vector<batch_operation>& operations) {
    auto& conn = db();
    std::lock_guard<std::recursive_mutex> lock(conn.mutex());

    // Nested, the batch would only release a savepoint and the cache could
    // outlive an outer rollback
    if (conn.is_in_transaction()) {
        LOG_ERROR("batch", "Refusing batch of %zu operations inside an open transaction",
                  operations.size());
        throw db_error("batch cannot run inside an open transaction", SQLITE_MISUSE);
    }

    std::vector<std::pair<std::string, record_id_t>> created;
    std::vector<std::pair<std::string, record_id_t>> removed;

    LOG_DEBUG("batch", "Applying %zu operations", operations.size());

    transaction tx(conn);
    try {
        for (const auto& operation : operations) {
            std::visit([&](auto&& op) {
                using T = std::decay_t<decltype(op)>;
                if constexpr (std::is_same_v<T, execute_op>) {
                    conn.execute(op.sql, op.args);
                } else if constexpr (std::is_same_v<T, create_op>) {
                    conn.execute(op.sql, op.args);
                    created.emplace_back(op.table, op.id);
                } else if constexpr (std::is_same_v<T, mark_deleted_op>) {
                    conn.execute("UPDATE " + quote_identifier(op.table) +
                                 " SET _status = 'deleted' WHERE id == ?",
                                 positional_args_t{op.id});
                    removed.emplace_back(op.table, op.id);
                } else if constexpr (std::is_same_v<T, destroy_permanently_op>) {
                    conn.execute("DELETE FROM " + quote_identifier(op.table) + " WHERE id == ?",
                                 positional_args_t{op.id});
                    removed.emplace_back(op.table, op.id);
                } else {
                    static_assert(!sizeof(T), "unhandled batch operation");
                }
            }, operation);
        }
        tx.commit();
    } catch (const std::exception& e) {
        LOG_ERROR("batch", "Batch of %zu operations rolled back: %s", operations.size(), e.what());
        throw;
    }

    if (!tx.committed()) {
        return;
    }

    for (const auto& [table, id] : created) {
        cache_.mark_as_cached(table, id);
    }
    for (const auto& [table, id] : removed) {
        cache_.remove_from_cache(table, id);
    }
}

std::size_t driver::destroy_deleted_records(const std::string& table,
                                            const std::vector<record_id_t>& ids) {
    if (ids.empty()) {
        return 0;
    }

    auto& conn = db();
    std::lock_guard<std::recursive_mutex> lock(conn.mutex());

    std::size_t deleted = 0;
    conn.in_transaction([&] {
        for (std::size_t start = 0; start < ids.size(); start += delete_chunk_size) {
            auto end = std::min(ids.size(), start + delete_chunk_size);

            std::ostringstream sql;
            sql << "DELETE FROM " << quote_identifier(table) << " WHERE id IN (";
            positional_args_t args;
            for (auto i = start; i < end; ++i) {
                if (i != start) sql << ",";
                sql << "?";
                args.emplace_back(ids[i]);
            }
            sql << ")";

            conn.execute(sql.str(), args);
            deleted += static_cast<std::size_t>(conn.changes());
        }
    });

    for (const auto& id : ids) {
        cache_.remove_from_cache(table, id);
    }

    if (deleted != ids.size()) {
        LOG_DEBUG("driver", "destroy_deleted_records(%s): %zu of %zu ids deleted",
                  table.c_str(), deleted, ids.size());
    }
    return deleted;
}

// MARK: Local storage

std::optional<std::string> driver::get_local(const std::string& key) {
    auto rows = db().query("SELECT `value` FROM `local_storage` WHERE `key` = ?",
                           positional_args_t{key});
    if (rows.empty()) {
        return std::nullopt;
    }
    const auto& value = rows.front().at("value");
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    throw db_error("local_storage value for \"" + key + "\" is not text");
}

void driver::set_local(const std::string& key, const std::string& value) {
    batch({execute_op{"INSERT OR REPLACE INTO `local_storage` (`key`, `value`) VALUES (:key, :value)",
                      named_args_t{{"key", key}, {"value", value}}}});
}

void driver::remove_local(const std::string& key) {
    batch({execute_op{"DELETE FROM `local_storage` WHERE `key` = :key",
                      named_args_t{{"key", key}}}});
}

} // namespace tessera
