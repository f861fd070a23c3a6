#include "tessera.h"
#include "tessera_json.hpp"
#include <TesseraCore.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

// Thread-local error storage
static thread_local std::string g_last_error;
static thread_local int32_t g_last_error_version = 0;

static void set_error(const std::string& msg, int32_t database_version = 0) {
    g_last_error = msg;
    g_last_error_version = database_version;
}

static void clear_error() {
    g_last_error.clear();
    g_last_error_version = 0;
}

static char* copy_string(const std::string& str) {
    char* ret = static_cast<char*>(malloc(str.size() + 1));
    if (ret) {
        std::memcpy(ret, str.c_str(), str.size() + 1);
    }
    return ret;
}

// SQLite stores TEXT without validating UTF-8; invalid sequences become U+FFFD
// so a row that was just marked cached always reaches the caller.
static char* dump_result(const nlohmann::json& result) {
    return copy_string(result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

static nlohmann::json parse_json(const char* text) {
    if (!text) {
        return nullptr;
    }
    return nlohmann::json::parse(text);
}

// Run body, translating exceptions into status codes and the last-error slot
template<typename F>
static tessera_status_t guarded(F&& body) {
    clear_error();
    try {
        body();
        return TESSERA_OK;
    } catch (const tessera::driver_error& e) {
        set_error(e.what());
        switch (e.kind()) {
            case tessera::driver_errc::migration_needed:
                g_last_error_version = e.get_if<tessera::migration_needed>()->database_version;
                return TESSERA_ERROR_MIGRATION_NEEDED;
            case tessera::driver_errc::schema_needed:
                g_last_error_version = e.get_if<tessera::schema_needed>()->database_version;
                return TESSERA_ERROR_SCHEMA_NEEDED;
            case tessera::driver_errc::incompatible_migration:
                g_last_error_version = e.get_if<tessera::incompatible_migration>()->database_version;
                return TESSERA_ERROR_INCOMPATIBLE_MIGRATION;
            case tessera::driver_errc::unknown_batch_operation:
                return TESSERA_ERROR_UNKNOWN_BATCH_OPERATION;
        }
        return TESSERA_ERROR_DATABASE;
    } catch (const nlohmann::json::exception& e) {
        set_error(std::string("Invalid JSON: ") + e.what());
        return TESSERA_ERROR_INVALID_ARGUMENT;
    } catch (const std::invalid_argument& e) {
        set_error(e.what());
        return TESSERA_ERROR_INVALID_ARGUMENT;
    } catch (const std::exception& e) {
        set_error(e.what());
        return TESSERA_ERROR_DATABASE;
    }
}

// =============================================================================
// Opaque Type Definitions (internal)
// =============================================================================

struct tessera_driver {
    tessera::driver driver;
};

// =============================================================================
// Error Handling
// =============================================================================

extern "C" const char* tessera_last_error(void) {
    return g_last_error.empty() ? nullptr : g_last_error.c_str();
}

extern "C" int32_t tessera_last_error_database_version(void) {
    return g_last_error_version;
}

extern "C" void tessera_set_log_level(int level) {
    if (level < static_cast<int>(tessera::log_level::off)) {
        level = static_cast<int>(tessera::log_level::off);
    } else if (level > static_cast<int>(tessera::log_level::debug)) {
        level = static_cast<int>(tessera::log_level::debug);
    }
    tessera::set_log_level(static_cast<tessera::log_level>(level));
}

extern "C" void tessera_string_free(char* str) {
    if (str) {
        free(str);
    }
}

// =============================================================================
// Driver Lifecycle
// =============================================================================

extern "C" tessera_driver_t* tessera_driver_create(void) {
    try {
        return new tessera_driver();
    } catch (const std::exception& e) {
        set_error(e.what());
        return nullptr;
    }
}

extern "C" void tessera_driver_free(tessera_driver_t* driver) {
    delete driver;
}

extern "C" tessera_status_t tessera_driver_initialize(tessera_driver_t* driver,
                                                      const char* db_name,
                                                      int32_t schema_version) {
    if (!driver || !db_name) {
        set_error("null argument");
        return TESSERA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        driver->driver.initialize(db_name, schema_version);
    });
}

extern "C" tessera_status_t tessera_driver_set_up_with_schema(tessera_driver_t* driver,
                                                              const char* db_name,
                                                              const char* schema_sql,
                                                              int32_t schema_version) {
    if (!driver || !db_name || !schema_sql) {
        set_error("null argument");
        return TESSERA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        driver->driver.set_up_with_schema(db_name, schema_sql, schema_version);
    });
}

extern "C" tessera_status_t tessera_driver_set_up_with_migrations(tessera_driver_t* driver,
                                                                  const char* db_name,
                                                                  const char* migration_json) {
    if (!driver || !db_name || !migration_json) {
        set_error("null argument");
        return TESSERA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        auto step = tessera::migration_from_json(parse_json(migration_json));
        driver->driver.set_up_with_migrations(db_name, step);
    });
}

extern "C" tessera_status_t tessera_driver_unsafe_reset_database(tessera_driver_t* driver,
                                                                 const char* schema_sql,
                                                                 int32_t schema_version) {
    if (!driver || !schema_sql) {
        set_error("null argument");
        return TESSERA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        driver->driver.unsafe_reset_database({schema_sql, schema_version});
    });
}

// =============================================================================
// Queries
// =============================================================================

extern "C" tessera_status_t tessera_driver_find(tessera_driver_t* driver,
                                                const char* table,
                                                const char* id,
                                                char** out_json) {
    if (!driver || !table || !id || !out_json) {
        set_error("null argument");
        return TESSERA_ERROR_NULL_POINTER;
    }
    *out_json = nullptr;
    return guarded([&] {
        auto found = driver->driver.find(table, id);
        nlohmann::json result = found ? tessera::to_json(*found) : nlohmann::json(nullptr);
        *out_json = dump_result(result);
    });
}

extern "C" tessera_status_t tessera_driver_cached_query(tessera_driver_t* driver,
                                                        const char* table,
                                                        const char* sql,
                                                        const char* args_json,
                                                        char** out_json) {
    if (!driver || !table || !sql || !out_json) {
        set_error("null argument");
        return TESSERA_ERROR_NULL_POINTER;
    }
    *out_json = nullptr;
    return guarded([&] {
        auto args = tessera::positional_args_from_json(parse_json(args_json));
        auto entries = driver->driver.cached_query(table, sql, args);

        nlohmann::json result = nlohmann::json::array();
        for (const auto& entry : entries) {
            result.push_back(tessera::to_json(entry));
        }
        *out_json = dump_result(result);
    });
}

extern "C" tessera_status_t tessera_driver_query_ids(tessera_driver_t* driver,
                                                     const char* sql,
                                                     const char* args_json,
                                                     char** out_json) {
    if (!driver || !sql || !out_json) {
        set_error("null argument");
        return TESSERA_ERROR_NULL_POINTER;
    }
    *out_json = nullptr;
    return guarded([&] {
        auto args = tessera::positional_args_from_json(parse_json(args_json));
        nlohmann::json result = driver->driver.query_ids(sql, args);
        *out_json = dump_result(result);
    });
}

extern "C" tessera_status_t tessera_driver_count(tessera_driver_t* driver,
                                                 const char* sql,
                                                 const char* args_json,
                                                 int64_t* out_count) {
    if (!driver || !sql || !out_count) {
        set_error("null argument");
        return TESSERA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        auto args = tessera::positional_args_from_json(parse_json(args_json));
        *out_count = driver->driver.count(sql, args);
    });
}

extern "C" tessera_status_t tessera_driver_get_local(tessera_driver_t* driver,
                                                     const char* key,
                                                     char** out_value) {
    if (!driver || !key || !out_value) {
        set_error("null argument");
        return TESSERA_ERROR_NULL_POINTER;
    }
    *out_value = nullptr;
    return guarded([&] {
        if (auto value = driver->driver.get_local(key)) {
            *out_value = copy_string(*value);
        }
    });
}

// =============================================================================
// Writes
// =============================================================================

extern "C" tessera_status_t tessera_driver_batch(tessera_driver_t* driver,
                                                 const char* operations_json) {
    if (!driver || !operations_json) {
        set_error("null argument");
        return TESSERA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        auto operations = tessera::batch_from_json(parse_json(operations_json));
        driver->driver.batch(operations);
    });
}

extern "C" tessera_status_t tessera_driver_destroy_deleted_records(tessera_driver_t* driver,
                                                                   const char* table,
                                                                   const char* ids_json,
                                                                   size_t* out_deleted) {
    if (!driver || !table || !ids_json) {
        set_error("null argument");
        return TESSERA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        auto ids = tessera::ids_from_json(parse_json(ids_json));
        auto deleted = driver->driver.destroy_deleted_records(table, ids);
        if (out_deleted) {
            *out_deleted = deleted;
        }
    });
}
