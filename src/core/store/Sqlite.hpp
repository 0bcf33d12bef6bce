#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <sqlite3.h>

namespace ipe::sqlite {

struct DbCloser {
  void operator()(sqlite3* db) const { sqlite3_close(db); }
};
struct StmtFinalizer {
  void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

using DbHandle   = std::unique_ptr<sqlite3, DbCloser>;
using StmtHandle = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

// All helpers throw ipe::StoreError carrying sqlite3_errmsg text.
DbHandle open(const std::string& path, int flags, int busyTimeoutMs);
void execAll(sqlite3* db, const std::string& sql);
StmtHandle prepare(sqlite3* db, const char* sql);

void bindText(sqlite3_stmt* st, int idx, const std::string& v);
void bindText(sqlite3_stmt* st, int idx, const std::optional<std::string>& v);
void bindInt64(sqlite3_stmt* st, int idx, int64_t v);
void bindInt64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v);

// Steps a statement expected to produce no rows.
void stepDone(sqlite3* db, sqlite3_stmt* st, const char* what);
// Returns true on SQLITE_ROW, false on SQLITE_DONE, throws otherwise.
bool stepRow(sqlite3* db, sqlite3_stmt* st, const char* what);

std::string columnText(sqlite3_stmt* st, int col);
std::optional<std::string> columnOptText(sqlite3_stmt* st, int col);
std::optional<int64_t> columnOptInt64(sqlite3_stmt* st, int col);

// BEGIN IMMEDIATE on construction; rolls back on destruction unless commit() ran.
class Transaction {
public:
  explicit Transaction(sqlite3* db);
  ~Transaction();
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();

private:
  sqlite3* db_;
  bool done_ = false;
};

} // namespace ipe::sqlite
