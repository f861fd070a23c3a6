#pragma once

#ifdef __cplusplus

#include <string>

namespace tessera {

/// File extension every on-disk database carries.
inline constexpr const char* database_extension = ".db";

/// Resolve a logical database name to the location SQLite should open.
///
/// ":memory:" and "file::memory:" (with or without a query string) are
/// returned unchanged. Absolute paths and
/// "file:" URIs are kept as they are; anything else is placed under
/// working_directory. If the path lacks ".db" it is appended, or inserted in
/// front of the query string when the name has one:
///
///   resolve_path("app", "/srv")                           -> "/srv/app.db"
///   resolve_path("app?mode=memory&cache=shared", "/srv")  -> "/srv/app.db?mode=memory&cache=shared"
std::string resolve_path(const std::string& name, const std::string& working_directory);

/// resolve_path() relative to the process's current working directory.
std::string resolve_path(const std::string& name);

/// True for names that ask for a shared-cache in-memory database
/// (both "mode=memory" and "cache=shared" appear after the first character).
bool is_shared_memory_name(const std::string& name);

} // namespace tessera

#endif // __cplusplus
