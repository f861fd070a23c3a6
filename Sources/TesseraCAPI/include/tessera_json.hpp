#pragma once

#ifdef __cplusplus

#include <tessera/batch.hpp>
#include <tessera/driver.hpp>
#include <tessera/types.hpp>
#include <nlohmann/json.hpp>
#include <vector>

// JSON marshalling between the C surface and the driver. Malformed input
// throws std::invalid_argument; an unknown batch tag throws
// driver_error(unknown_batch_operation).
namespace tessera {

/// String, or an integer that is stringified.
record_id_t id_from_json(const nlohmann::json& value);

/// Array of ids as accepted by id_from_json.
std::vector<record_id_t> ids_from_json(const nlohmann::json& value);

/// null, bool, number or string.
arg_value_t arg_from_json(const nlohmann::json& value);

/// Array (or null for no arguments).
positional_args_t positional_args_from_json(const nlohmann::json& value);

/// Array for positional placeholders, object for named ones, null for none.
/// Object keys may carry their ':', '@' or '$' prefix.
statement_args_t args_from_json(const nlohmann::json& value);

/// Integer, integral float or numeric string.
int32_t version_from_json(const nlohmann::json& value);

/// {"from": ..., "to": ..., "sql": "..."}
migration migration_from_json(const nlohmann::json& value);

/// One tagged array, e.g. ["create", table, id, sql, args].
batch_operation operation_from_json(const nlohmann::json& value);

/// Decodes the whole array before anything runs, so a bad entry anywhere
/// rejects the batch without touching the database.
std::vector<batch_operation> batch_from_json(const nlohmann::json& value);

/// Blobs become arrays of byte values.
nlohmann::json to_json(const column_value_t& value);
nlohmann::json to_json(const row_t& row);

/// Bare ids become strings, rows become objects.
nlohmann::json to_json(const cached_entry_t& entry);

} // namespace tessera

#endif // __cplusplus
