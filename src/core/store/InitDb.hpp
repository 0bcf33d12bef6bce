#pragma once
#include <string>

namespace ipe {

constexpr int kSchemaVersion = 1;

// Creates the database file (and its parent directory) if needed and applies
// schema.sql. Safe to run against an already initialized database.
// Throws InitError if the file cannot be opened, is not a healthy SQLite
// database, or the schema cannot be applied.
void initDatabase(const std::string& dbPath,
                  const std::string& schemaPath,
                  int busyTimeoutMs);

} // namespace ipe
