#pragma once

// TesseraCore - transactional persistence driver over SQLite
//
// Usage:
//   #include <TesseraCore.hpp>
//
//   tessera::driver d;
//   try {
//       d.initialize("app", 3);
//   } catch (const tessera::driver_error& e) {
//       if (auto* needed = e.get_if<tessera::migration_needed>()) {
//           d.migrate({needed->database_version, 3, load_migrations(needed->database_version)});
//       } else {
//           d.unsafe_reset_database({load_schema(), 3});
//       }
//   }
//
//   auto tasks = d.cached_query("tasks", "SELECT * FROM tasks WHERE _status != 'deleted'");

#include "tessera/log.hpp"
#include "tessera/types.hpp"
#include "tessera/db.hpp"
#include "tessera/path.hpp"
#include "tessera/registry.hpp"
#include "tessera/record_cache.hpp"
#include "tessera/errors.hpp"
#include "tessera/batch.hpp"
#include "tessera/driver.hpp"
