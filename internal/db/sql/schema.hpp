#pragma once

#include <string>
#include <vector>

namespace checkout::db::sql {

/*
  Bootstrap DDL, applied in order by the factory on startup.
  Every statement is idempotent (IF NOT EXISTS).

  Statuses are stored as their enum names (TEXT) so the tables stay
  readable from psql/sqlite3.
*/

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

// Recorded in schema_migrations once the bootstrap has run.
inline constexpr int kSchemaVersion = 1;

} // namespace checkout::db::sql
