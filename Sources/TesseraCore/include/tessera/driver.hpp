#pragma once

#ifdef __cplusplus

#include "batch.hpp"
#include "db.hpp"
#include "errors.hpp"
#include "record_cache.hpp"
#include "registry.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tessera {

/// Schema SQL together with the version it produces.
struct schema {
    std::string sql;
    int32_t version = 0;
};

/// Transition from one schema version to the next.
struct migration {
    int32_t from = 0;
    int32_t to = 0;
    std::string sql;
};

/// Stored version equals the expected one.
struct compatible {};

using compatibility = std::variant<compatible, migration_needed, schema_needed>;

/// A read result: the bare id when the caller already holds the record,
/// otherwise the full row.
using cached_entry_t = std::variant<record_id_t, row_t>;

/// Key-value table created alongside every fresh schema.
inline constexpr const char* local_storage_schema =
    "create table local_storage (\n"
    "  key text primary key not null,\n"
    "  value text not null\n"
    ");\n"
    "create index local_storage_key_index on local_storage (key);\n";

/// Persistence driver over one SQLite connection.
///
/// Tracks which records the caller has already materialized (record_cache),
/// refuses to run against a database whose user_version does not match the
/// expected schema, and applies write batches atomically. Every operation
/// holds the connection's mutex for its whole duration, so drivers sharing
/// a shared-memory connection never interleave transactions.
///
/// Usage:
///   tessera::driver d;
///   d.set_up_with_schema("app", "create table tasks (id text primary key, _status text);", 1);
///   d.batch({tessera::create_op{"tasks", "t1",
///            "insert into tasks (id, _status) values (:id, 'created')",
///            tessera::named_args_t{{"id", std::string("t1")}}}});
///   auto hit = d.find("tasks", "t1");  // bare id "t1": the caller created it
class driver {
public:
    explicit driver(connection_registry& registry = connection_registry::shared());

    driver(const driver&) = delete;
    driver& operator=(const driver&) = delete;

    // MARK: Setup

    /// Open (or join, for shared-memory names) the database for name.
    void open(const connection_config& config);

    /// Open, then require the stored version to equal schema_version.
    void initialize(const std::string& name, int32_t schema_version);

    /// Open, wipe everything and install schema_sql at schema_version.
    void set_up_with_schema(const std::string& name, const std::string& schema_sql,
                            int32_t schema_version);

    /// Open and apply one migration, then require the stored version to equal its target.
    void set_up_with_migrations(const std::string& name, const migration& step);

    bool is_open() const { return db_ != nullptr; }

    // MARK: Schema gate

    compatibility check_compatibility(int32_t expected_version);

    /// Throws driver_error (migration_needed or schema_needed) unless compatible.
    void is_compatible(int32_t expected_version);

    /// Run the schema (plus local_storage) and stamp its version in one transaction.
    void set_up_schema(const schema& definition);

    /// Apply step if the stored version equals step.from, otherwise
    /// throw driver_error(incompatible_migration) without touching anything.
    void migrate(const migration& step);

    /// Destroy every table, clear the record cache, then set_up_schema(definition).
    void unsafe_reset_database(const schema& definition);

    int32_t schema_version();

    // MARK: Queries

    /// Bare id if cached, full row if found (and now cached), nullopt if absent.
    std::optional<cached_entry_t> find(const std::string& table, const record_id_t& id);

    /// Rows in query order; rows the caller already holds come back as bare ids.
    std::vector<cached_entry_t> cached_query(const std::string& table, const std::string& sql,
                                             const positional_args_t& args = {});

    /// Ids of the matching rows. Does not touch the cache.
    std::vector<record_id_t> query_ids(const std::string& sql, const positional_args_t& args = {});

    int64_t count(const std::string& sql, const positional_args_t& args = {});

    // MARK: Batches

    /// Apply operations in order inside one transaction. The record cache is
    /// updated only after the commit: first every create, then every removal,
    /// so a removal always wins over a create of the same id. Throws
    /// db_error(SQLITE_MISUSE) if a transaction is already open on the connection.
    void batch(const std::vector<batch_operation>& operations);

    /// Permanently delete previously soft-deleted rows. Best effort: ids that
    /// no longer exist are skipped. Returns the number of rows deleted.
    std::size_t destroy_deleted_records(const std::string& table,
                                        const std::vector<record_id_t>& ids);

    // MARK: Local storage

    std::optional<std::string> get_local(const std::string& key);
    void set_local(const std::string& key, const std::string& value);
    void remove_local(const std::string& key);

    // MARK: Record cache

    bool is_cached(const std::string& table, const record_id_t& id) const {
        return cache_.is_cached(table, id);
    }

    const record_cache& cache() const { return cache_; }

    /// Underlying connection. Throws db_error if the driver is not open.
    database& db();

private:
    connection_registry& registry_;
    std::shared_ptr<database> db_;
    record_cache cache_;
};

} // namespace tessera

#endif // __cplusplus
