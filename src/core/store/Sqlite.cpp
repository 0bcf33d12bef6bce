#include "Sqlite.hpp"

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace ipe::sqlite {

DbHandle open(const std::string& path, int flags, int busyTimeoutMs) {
  sqlite3* raw = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
  DbHandle db(raw); // sqlite hands back a handle even on failure
  if (rc != SQLITE_OK) {
    std::string msg = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
    throw StoreError("failed to open db '" + path + "': " + msg);
  }
  sqlite3_busy_timeout(db.get(), busyTimeoutMs);
  return db;
}

void execAll(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw StoreError("SQLite exec failed: " + msg);
  }
}

StmtHandle prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db));
  }
  return StmtHandle(st);
}

void bindText(sqlite3_stmt* st, int idx, const std::string& v) {
  sqlite3_bind_text(st, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

void bindText(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
  if (v) bindText(st, idx, *v);
  else   sqlite3_bind_null(st, idx);
}

void bindInt64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, v);
}

void bindInt64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) sqlite3_bind_int64(st, idx, *v);
  else   sqlite3_bind_null(st, idx);
}

void stepDone(sqlite3* db, sqlite3_stmt* st, const char* what) {
  if (sqlite3_step(st) != SQLITE_DONE)
    throw StoreError(std::string(what) + " failed: " + sqlite3_errmsg(db));
}

bool stepRow(sqlite3* db, sqlite3_stmt* st, const char* what) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw StoreError(std::string(what) + " failed: " + sqlite3_errmsg(db));
}

std::string columnText(sqlite3_stmt* st, int col) {
  const unsigned char* p = sqlite3_column_text(st, col);
  if (!p) return {};
  return std::string(reinterpret_cast<const char*>(p),
                     static_cast<size_t>(sqlite3_column_bytes(st, col)));
}

std::optional<std::string> columnOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return columnText(st, col);
}

std::optional<int64_t> columnOptInt64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

Transaction::Transaction(sqlite3* db) : db_(db) {
  execAll(db_, "BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
  if (done_) return;
  char* err = nullptr;
  if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::warn("rollback failed: {}", err ? err : sqlite3_errmsg(db_));
    sqlite3_free(err);
  }
}

void Transaction::commit() {
  execAll(db_, "COMMIT;");
  done_ = true;
}

} // namespace ipe::sqlite
