// src/core/store/InitDb.cpp
#include "InitDb.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "Sqlite.hpp"
#include "core/Errors.hpp"

namespace ipe {

static std::string readSchema(const std::string& schemaPath) {
  std::ifstream in(schemaPath);
  if (!in) throw InitError("Cannot open schema file: " + schemaPath);
  std::ostringstream buf; buf << in.rdbuf();
  return buf.str();
}

static void quickCheck(sqlite3* db) {
  auto st = sqlite::prepare(db, "PRAGMA quick_check;");
  if (!sqlite::stepRow(db, st.get(), "quick_check"))
    throw InitError("quick_check returned no result");
  const std::string verdict = sqlite::columnText(st.get(), 0);
  if (verdict != "ok") throw InitError("database is corrupt: " + verdict);
}

void initDatabase(const std::string& dbPath,
                  const std::string& schemaPath,
                  int busyTimeoutMs) {
  namespace fs = std::filesystem;
  const fs::path parent = fs::path(dbPath).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) throw InitError("Cannot create " + parent.string() + ": " + ec.message());
  }

  // Read first so a missing schema never leaves an empty db file behind.
  const std::string schema = readSchema(schemaPath);

  try {
    auto db = sqlite::open(dbPath,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           busyTimeoutMs);

    quickCheck(db.get());

    // Pragmas: concurrency + durability + integrity
    sqlite::execAll(db.get(), "PRAGMA journal_mode=WAL;");
    sqlite::execAll(db.get(), "PRAGMA synchronous=NORMAL;");
    sqlite::execAll(db.get(), "PRAGMA foreign_keys=ON;");

    sqlite::Transaction tx(db.get());
    sqlite::execAll(db.get(), schema);
    sqlite::execAll(db.get(), "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
    tx.commit();
  } catch (const InitError&) {
    throw;
  } catch (const StoreError& e) {
    throw InitError(e.what());
  }

  spdlog::debug("schema v{} applied to {}", kSchemaVersion, dbPath);
}

} // namespace ipe
