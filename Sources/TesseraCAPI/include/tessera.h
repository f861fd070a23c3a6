#ifndef TESSERA_C_API_H
#define TESSERA_C_API_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Opaque Types
// =============================================================================

typedef struct tessera_driver tessera_driver_t;

// =============================================================================
// Error Handling
// =============================================================================

typedef enum {
    TESSERA_OK = 0,
    TESSERA_ERROR_NULL_POINTER = -1,
    TESSERA_ERROR_INVALID_ARGUMENT = -2,
    TESSERA_ERROR_DATABASE = -3,
    TESSERA_ERROR_MIGRATION_NEEDED = -4,
    TESSERA_ERROR_SCHEMA_NEEDED = -5,
    TESSERA_ERROR_INCOMPATIBLE_MIGRATION = -6,
    TESSERA_ERROR_UNKNOWN_BATCH_OPERATION = -7,
} tessera_status_t;

// Get the last error message (thread-local, NULL if none)
const char* tessera_last_error(void);

// Stored schema version carried by the last MIGRATION_NEEDED,
// SCHEMA_NEEDED or INCOMPATIBLE_MIGRATION error on this thread
int32_t tessera_last_error_database_version(void);

// 0 = off, 1 = error, 2 = warn, 3 = info, 4 = debug
void tessera_set_log_level(int level);

// Free a string returned by this API
void tessera_string_free(char* str);

// =============================================================================
// Driver Lifecycle
// =============================================================================

// Create a driver bound to the process-wide connection registry
tessera_driver_t* tessera_driver_create(void);

void tessera_driver_free(tessera_driver_t* driver);

// Open db_name and check it is at schema_version
tessera_status_t tessera_driver_initialize(tessera_driver_t* driver,
                                           const char* db_name,
                                           int32_t schema_version);

// Open db_name, destroy its contents and install schema_sql at schema_version
tessera_status_t tessera_driver_set_up_with_schema(tessera_driver_t* driver,
                                                   const char* db_name,
                                                   const char* schema_sql,
                                                   int32_t schema_version);

// Open db_name and apply a migration
// migration_json: {"from": 3, "to": 5, "sql": "..."} (versions may be numeric strings)
tessera_status_t tessera_driver_set_up_with_migrations(tessera_driver_t* driver,
                                                       const char* db_name,
                                                       const char* migration_json);

// Destroy everything and install schema_sql at schema_version
tessera_status_t tessera_driver_unsafe_reset_database(tessera_driver_t* driver,
                                                      const char* schema_sql,
                                                      int32_t schema_version);

// =============================================================================
// Queries
// =============================================================================
// args_json: JSON array of positional arguments (NULL = no arguments)
// Results are written to *out_json (caller must free with tessera_string_free)

// *out_json: row object, bare id string, or null when not found
tessera_status_t tessera_driver_find(tessera_driver_t* driver,
                                     const char* table,
                                     const char* id,
                                     char** out_json);

// *out_json: array of row objects and bare id strings
tessera_status_t tessera_driver_cached_query(tessera_driver_t* driver,
                                             const char* table,
                                             const char* sql,
                                             const char* args_json,
                                             char** out_json);

// *out_json: array of id strings
tessera_status_t tessera_driver_query_ids(tessera_driver_t* driver,
                                          const char* sql,
                                          const char* args_json,
                                          char** out_json);

tessera_status_t tessera_driver_count(tessera_driver_t* driver,
                                      const char* sql,
                                      const char* args_json,
                                      int64_t* out_count);

// *out_value: stored value, or NULL when the key is absent
tessera_status_t tessera_driver_get_local(tessera_driver_t* driver,
                                          const char* key,
                                          char** out_value);

// =============================================================================
// Writes
// =============================================================================

// operations_json: array of tagged operations
//   ["execute", sql, args]
//   ["create", table, id, sql, args]
//   ["markAsDeleted", table, id]
//   ["destroyPermanently", table, id]
// args is a JSON object (named placeholders) or array (positional).
tessera_status_t tessera_driver_batch(tessera_driver_t* driver,
                                      const char* operations_json);

// ids_json: JSON array of id strings
// *out_deleted (optional): number of rows actually deleted
tessera_status_t tessera_driver_destroy_deleted_records(tessera_driver_t* driver,
                                                        const char* table,
                                                        const char* ids_json,
                                                        size_t* out_deleted);

#ifdef __cplusplus
}
#endif

#endif // TESSERA_C_API_H
