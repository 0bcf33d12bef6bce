#include "PullStore.hpp"

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/store/InitDb.hpp"

namespace ipe {

namespace {

constexpr const char* kEventColumns =
    "id, image, registry, outcome, detail, ts, duration_ms, bytes";

PullEvent readEvent(sqlite3_stmt* st) {
  PullEvent ev;
  ev.id       = sqlite3_column_int64(st, 0);
  ev.image    = sqlite::columnText(st, 1);
  ev.registry = sqlite::columnText(st, 2);
  const std::string outcome = sqlite::columnText(st, 3);
  auto parsed = parse_outcome(outcome);
  if (!parsed) throw StoreError("unknown outcome '" + outcome + "' in event " + std::to_string(ev.id));
  ev.outcome     = *parsed;
  ev.detail      = sqlite::columnOptText(st, 4);
  ev.timestamp   = sqlite3_column_int64(st, 5);
  ev.duration_ms = sqlite::columnOptInt64(st, 6);
  ev.bytes       = sqlite::columnOptInt64(st, 7);
  return ev;
}

} // namespace

PullStore::PullStore(StoreOptions opts) : opts_(std::move(opts)) {}

void PullStore::initialize() {
  if (initialized_.load()) return;
  initDatabase(opts_.dbPath, opts_.schemaPath, opts_.busyTimeoutMs);
  initialized_.store(true);
  spdlog::info("store ready at {}", opts_.dbPath);
}

sqlite::DbHandle PullStore::connect() const {
  // No SQLITE_OPEN_CREATE: a vanished file is an error, not a new empty db.
  auto db = sqlite::open(opts_.dbPath,
                         SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX,
                         opts_.busyTimeoutMs);
  sqlite::execAll(db.get(), "PRAGMA synchronous=NORMAL;");
  return db;
}

int64_t PullStore::recordEvent(const PullEvent& ev) {
  if (!isInitialized()) throw NotInitializedError();

  int64_t success = 0, failure = 0;
  switch (ev.outcome) {
    case Outcome::Success: success = 1; break;
    case Outcome::Failure: failure = 1; break;
  }

  try {
    auto db = connect();
    sqlite::Transaction tx(db.get());

    auto ins = sqlite::prepare(db.get(), R"SQL(
      INSERT INTO pull_events (image, registry, outcome, detail, ts, duration_ms, bytes)
      VALUES (?,?,?,?,?,?,?)
    )SQL");
    int i = 1;
    sqlite::bindText(ins.get(), i++, ev.image);
    sqlite::bindText(ins.get(), i++, ev.registry);
    sqlite::bindText(ins.get(), i++, std::string(to_string(ev.outcome)));
    sqlite::bindText(ins.get(), i++, ev.detail);
    sqlite::bindInt64(ins.get(), i++, ev.timestamp);
    sqlite::bindInt64(ins.get(), i++, ev.duration_ms);
    sqlite::bindInt64(ins.get(), i++, ev.bytes);
    sqlite::stepDone(db.get(), ins.get(), "insert pull_event");
    const int64_t id = sqlite3_last_insert_rowid(db.get());

    auto upd = sqlite::prepare(db.get(), R"SQL(
      INSERT INTO pull_counters (image, total, success, failure, last_seen)
      VALUES (?1, 1, ?2, ?3, ?4)
      ON CONFLICT(image) DO UPDATE SET
        total     = total + 1,
        success   = success + excluded.success,
        failure   = failure + excluded.failure,
        last_seen = MAX(last_seen, excluded.last_seen)
    )SQL");
    sqlite::bindText(upd.get(), 1, ev.image);
    sqlite::bindInt64(upd.get(), 2, success);
    sqlite::bindInt64(upd.get(), 3, failure);
    sqlite::bindInt64(upd.get(), 4, ev.timestamp);
    sqlite::stepDone(db.get(), upd.get(), "upsert pull_counter");

    tx.commit();
    return id;
  } catch (const StoreError& e) {
    throw WriteError(e.what());
  }
}

std::vector<Counter> PullStore::queryCounters(const std::optional<std::string>& image) const {
  if (!isInitialized()) throw NotInitializedError();

  try {
    auto db = connect();
    auto st = sqlite::prepare(db.get(), image
        ? "SELECT image, total, success, failure, last_seen FROM pull_counters WHERE image = ?"
        : "SELECT image, total, success, failure, last_seen FROM pull_counters ORDER BY image");
    if (image) sqlite::bindText(st.get(), 1, *image);

    std::vector<Counter> out;
    while (sqlite::stepRow(db.get(), st.get(), "query pull_counters")) {
      Counter c;
      c.image     = sqlite::columnText(st.get(), 0);
      c.total     = sqlite3_column_int64(st.get(), 1);
      c.success   = sqlite3_column_int64(st.get(), 2);
      c.failure   = sqlite3_column_int64(st.get(), 3);
      c.last_seen = sqlite3_column_int64(st.get(), 4);
      out.push_back(std::move(c));
    }
    return out;
  } catch (const StoreError& e) {
    throw ReadError(e.what());
  }
}

std::vector<PullEvent> PullStore::recentEvents(int limit) const {
  if (!isInitialized()) throw NotInitializedError();

  try {
    auto db = connect();
    const std::string sql = std::string("SELECT ") + kEventColumns +
                            " FROM pull_events ORDER BY id DESC LIMIT ?";
    auto st = sqlite::prepare(db.get(), sql.c_str());
    sqlite::bindInt64(st.get(), 1, static_cast<int64_t>(limit));

    std::vector<PullEvent> out;
    while (sqlite::stepRow(db.get(), st.get(), "query recent pull_events"))
      out.push_back(readEvent(st.get()));
    return out;
  } catch (const StoreError& e) {
    throw ReadError(e.what());
  }
}

std::optional<PullEvent> PullStore::findEvent(int64_t id) const {
  if (!isInitialized()) throw NotInitializedError();

  try {
    auto db = connect();
    const std::string sql = std::string("SELECT ") + kEventColumns +
                            " FROM pull_events WHERE id = ?";
    auto st = sqlite::prepare(db.get(), sql.c_str());
    sqlite::bindInt64(st.get(), 1, id);
    if (!sqlite::stepRow(db.get(), st.get(), "query pull_event"))
      return std::nullopt;
    return readEvent(st.get());
  } catch (const StoreError& e) {
    throw ReadError(e.what());
  }
}

bool PullStore::healthCheck() const noexcept {
  try {
    auto db = connect();
    auto st = sqlite::prepare(db.get(), "SELECT count(*) FROM sqlite_master;");
    return sqlite::stepRow(db.get(), st.get(), "health check");
  } catch (const std::exception& e) {
    spdlog::warn("health check failed: {}", e.what());
    return false;
  }
}

} // namespace ipe
