#include "tessera/db.hpp"
#include "tessera/log.hpp"
#include <memory>
#include <sstream>

namespace tessera {

namespace {

using statement_ptr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// Paths with a query string must be opened as URIs for SQLite to honour
// parameters such as mode=memory&cache=shared.
std::string open_name(const std::string& path) {
    if (path.rfind("file:", 0) != 0 && path.find('?') != std::string::npos) {
        return "file:" + path;
    }
    return path;
}

} // namespace

database::database(const std::string& path, open_mode mode) : path_(path), mode_(mode) {
    // Determine SQLite open flags based on mode
    int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;  // Always use serialized threading mode
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(open_name(path).c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error, rc);
    }
    sqlite3_extended_result_codes(db_, 1);

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);

    // Enable foreign keys
    execute("PRAGMA foreign_keys = ON");

    // Enable WAL mode (only on read-write connection; in-memory databases keep "memory")
    if (mode == open_mode::read_write) {
        execute("PRAGMA journal_mode = WAL");
    }

    execute("PRAGMA cache_size = 50000");       // Large cache for performance
    execute("PRAGMA temp_store = MEMORY");      // Temp tables in RAM

    LOG_DEBUG("db", "Opened %s", path.c_str());
}

database::~database() {
    if (db_) {
        if (mode_ == open_mode::read_write) {
            sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
        }
        sqlite3_close_v2(db_);
    }
}

void database::execute(const std::string& sql, const statement_args_t& args) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (args_empty(args)) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")",
                           sqlite3_extended_errcode(db_));
        }
        return;
    }

    // Prepared statement path for parameterized statements
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare statement: %s (SQL: %s)", sqlite3_errmsg(db_), sql.c_str());
        throw db_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)),
                       sqlite3_extended_errcode(db_));
    }
    statement_ptr stmt(raw, &sqlite3_finalize);

    bind_args(stmt.get(), args);

    rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        int code = sqlite3_extended_errcode(db_);
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Execution failed: " + error, code);
    }
}

void database::execute_statements(const std::string& sql) {
    execute(sql);
}

std::vector<row_t> database::query(const std::string& sql, const statement_args_t& args) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "%s in %s", sqlite3_errmsg(db_), sql.c_str());
        throw db_error("Failed to prepare query: " + std::string(sqlite3_errmsg(db_)),
                       sqlite3_extended_errcode(db_));
    }
    statement_ptr stmt(raw, &sqlite3_finalize);

    bind_args(stmt.get(), args);

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt.get());

    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt.get(), i);
            row[name] = extract_column(stmt.get(), i);
        }
        results.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Query failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Query failed: " + error, sqlite3_extended_errcode(db_));
    }

    return results;
}

int64_t database::count(const std::string& sql, const statement_args_t& args) {
    auto rows = query(sql, args);
    if (rows.empty()) {
        throw db_error("Invalid count query, can't find results (SQL: " + sql + ")");
    }

    const row_t& row = rows.front();
    auto it = row.find("count");
    if (it == row.end()) {
        if (row.size() != 1) {
            throw db_error("Invalid count query, no count column (SQL: " + sql + ")");
        }
        it = row.begin();
    }

    if (const auto* i = std::get_if<int64_t>(&it->second)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&it->second)) {
        // [-2^63, 2^63) converts without overflow; NaN fails both tests
        if (*d >= -9223372036854775808.0 && *d < 9223372036854775808.0) {
            return static_cast<int64_t>(*d);
        }
        throw db_error("Invalid count query, count is out of range (SQL: " + sql + ")", SQLITE_RANGE);
    }
    throw db_error("Invalid count query, count is not a number (SQL: " + sql + ")");
}

int64_t database::changes() const {
    return sqlite3_changes64(db_);
}

int32_t database::user_version() {
    auto rows = query("PRAGMA user_version");
    if (rows.empty()) {
        throw db_error("Failed to read user_version");
    }
    const auto& value = rows.front().begin()->second;
    if (const auto* v = std::get_if<int64_t>(&value)) {
        return static_cast<int32_t>(*v);
    }
    throw db_error("user_version is not an integer");
}

void database::set_user_version(int32_t version) {
    // PRAGMA does not accept bound parameters
    execute("PRAGMA user_version = " + std::to_string(version));
}

void database::bind_args(sqlite3_stmt* stmt, const statement_args_t& args) {
    if (const auto* positional = std::get_if<positional_args_t>(&args)) {
        int param_count = sqlite3_bind_parameter_count(stmt);
        if (static_cast<int>(positional->size()) > param_count) {
            throw db_error("Too many parameter values were provided: " +
                           std::to_string(positional->size()) + " for " +
                           std::to_string(param_count) + " placeholders", SQLITE_RANGE);
        }
        int index = 1;
        for (const auto& arg : *positional) {
            bind_value(stmt, index++, to_column_value(arg));
        }
        return;
    }

    const auto& named = std::get<named_args_t>(args);
    int param_count = sqlite3_bind_parameter_count(stmt);
    for (int i = 1; i <= param_count; ++i) {
        const char* name = sqlite3_bind_parameter_name(stmt, i);
        if (!name || name[0] == '?') {
            throw db_error("Named arguments cannot be bound to anonymous placeholder " +
                           std::to_string(i), SQLITE_RANGE);
        }
        // Strip the ':', '@' or '$' prefix
        auto it = named.find(std::string(name + 1));
        if (it == named.end()) {
            throw db_error("Missing named parameter \"" + std::string(name + 1) + "\"", SQLITE_RANGE);
        }
        bind_value(stmt, i, to_column_value(it->second));
    }
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    int rc = std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else {
            if (v.empty()) {
                return sqlite3_bind_zeroblob(stmt, index, 0);
            }
            return sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);

    if (rc != SQLITE_OK) {
        throw db_error("Failed to bind parameter " + std::to_string(index) + ": " +
                       sqlite3_errstr(rc), rc);
    }
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return std::string(text ? text : "", text ? static_cast<size_t>(size) : 0);
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

std::string database::savepoint_name(int depth) const {
    return "tessera_sp_" + std::to_string(depth);
}

void database::begin_transaction() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (transaction_depth_ == 0) {
        // Use BEGIN IMMEDIATE to acquire the write lock up front
        int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            LOG_ERROR("db", "Failed to begin transaction: %s", sqlite3_errmsg(db_));
            throw db_error("Failed to begin transaction: " + std::string(sqlite3_errmsg(db_)),
                           sqlite3_extended_errcode(db_));
        }
    } else {
        execute("SAVEPOINT " + savepoint_name(transaction_depth_));
    }
    ++transaction_depth_;
}

void database::commit() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (transaction_depth_ == 0) {
        throw db_error("Cannot commit: no transaction is active");
    }
    if (transaction_depth_ == 1) {
        execute("COMMIT");
    } else {
        execute("RELEASE " + savepoint_name(transaction_depth_ - 1));
    }
    --transaction_depth_;
}

void database::rollback() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (transaction_depth_ == 0) {
        throw db_error("Cannot roll back: no transaction is active");
    }
    --transaction_depth_;
    if (transaction_depth_ == 0) {
        // SQLite may already have rolled back on its own (e.g. SQLITE_FULL)
        if (is_in_transaction()) {
            execute("ROLLBACK");
        }
    } else {
        auto name = savepoint_name(transaction_depth_);
        execute("ROLLBACK TO " + name + "; RELEASE " + name);
    }
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

void database::unsafe_destroy_everything() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    // Triggers and views first; indexes go with their tables
    auto objects = query(
        "SELECT type, name FROM sqlite_master "
        "WHERE name NOT LIKE 'sqlite_%' AND type IN ('trigger', 'view', 'table') "
        "ORDER BY CASE type WHEN 'trigger' THEN 0 WHEN 'view' THEN 1 ELSE 2 END");

    // foreign_keys cannot be changed inside a transaction
    bool was_in_transaction = transaction_depth_ > 0;
    if (!was_in_transaction) {
        execute("PRAGMA foreign_keys = OFF");
    }

    try {
        in_transaction([&] {
            for (const auto& object : objects) {
                const auto& type = std::get<std::string>(object.at("type"));
                const auto& name = std::get<std::string>(object.at("name"));

                std::ostringstream sql;
                sql << "DROP ";
                if (type == "trigger") sql << "TRIGGER";
                else if (type == "view") sql << "VIEW";
                else sql << "TABLE";
                sql << " IF EXISTS \"";
                for (char c : name) {
                    if (c == '"') sql << '"';
                    sql << c;
                }
                sql << "\"";
                execute(sql.str());
            }
            set_user_version(0);
        });
    } catch (const db_error&) {
        if (!was_in_transaction) {
            execute("PRAGMA foreign_keys = ON");
        }
        throw;
    }

    if (!was_in_transaction) {
        execute("PRAGMA foreign_keys = ON");
        execute("VACUUM");
    }

    LOG_INFO("db", "Destroyed all contents of %s (%zu objects)", path_.c_str(), objects.size());
}

// Transaction RAII guard
transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("transaction", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    bool outermost = db_.transaction_depth() == 1;
    db_.commit();
    completed_ = true;
    committed_ = outermost;
}

void transaction::rollback() {
    completed_ = true;
    db_.rollback();
}

} // namespace tessera
