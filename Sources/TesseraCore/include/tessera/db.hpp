#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <mutex>
#include <stdexcept>

namespace tessera {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg, int code = SQLITE_ERROR)
        : std::runtime_error(msg), code_(code) {}

    /// SQLite (extended) result code of the failing call.
    int code() const noexcept { return code_; }

private:
    int code_;
};

/// One open SQLite connection.
///
/// Every public operation locks the connection's recursive mutex, so a
/// handle shared between several drivers still runs one statement (and one
/// transaction) at a time. Callers that need several statements to be
/// serialized as a unit hold mutex() themselves.
class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access
    };

    explicit database(const std::string& path, open_mode mode = open_mode::read_write);
    ~database();

    // Non-copyable and non-moveable (owns a mutex other drivers may be waiting on)
    database(const database&) = delete;
    database& operator=(const database&) = delete;
    database(database&&) = delete;
    database& operator=(database&&) = delete;

    // Execute a single statement. Without arguments the SQL may hold several statements.
    void execute(const std::string& sql,
                 const statement_args_t& args = positional_args_t{});

    // Execute one or more ';'-separated statements (schema and migration scripts)
    void execute_statements(const std::string& sql);

    // Query - returns rows as vector of column maps
    std::vector<row_t> query(const std::string& sql,
                             const statement_args_t& args = positional_args_t{});

    // Run a count query. Reads the "count" column of the first row, or the
    // only column when the query returns exactly one.
    int64_t count(const std::string& sql,
                  const statement_args_t& args = positional_args_t{});

    // Rows modified by the most recent INSERT, UPDATE or DELETE
    int64_t changes() const;

    // PRAGMA user_version
    int32_t user_version();
    void set_user_version(int32_t version);

    // Transaction support. Nested begin_transaction() calls open savepoints.
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    /// 0 outside begin_transaction(), 1 for the outermost transaction, +1 per savepoint.
    int transaction_depth() const { return transaction_depth_; }

    /// Run body inside a transaction. Commits iff body returns normally;
    /// otherwise rolls back and rethrows.
    template<typename F>
    void in_transaction(F&& body);

    /// Drop every table, view, index and trigger and reset user_version to 0.
    void unsafe_destroy_everything();

    std::recursive_mutex& mutex() const { return mutex_; }

    const std::string& path() const { return path_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
    int transaction_depth_ = 0;
    mutable std::recursive_mutex mutex_;

    void bind_args(sqlite3_stmt* stmt, const statement_args_t& args);
    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
    std::string savepoint_name(int depth) const;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

    /// True once commit() has issued the outermost COMMIT. Releasing a
    /// savepoint does not count: an enclosing rollback can still undo it.
    bool committed() const { return committed_; }

private:
    database& db_;
    bool completed_ = false;
    bool committed_ = false;
};

template<typename F>
void database::in_transaction(F&& body) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    transaction tx(*this);
    body();
    tx.commit();
}

} // namespace tessera

#endif // __cplusplus
