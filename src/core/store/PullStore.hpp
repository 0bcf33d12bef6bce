#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/model/PullEvent.hpp"
#include "core/store/Sqlite.hpp"

namespace ipe {

struct StoreOptions {
  std::string dbPath;
  std::string schemaPath;
  int         busyTimeoutMs = 5000;
};

// Append-only pull event log plus per-image counters, backed by SQLite.
//
// Every call opens its own connection, so one PullStore can be shared by all
// HTTP worker threads. Writers are serialized by SQLite's write lock
// (BEGIN IMMEDIATE); readers see the last committed state (WAL).
class PullStore {
public:
  explicit PullStore(StoreOptions opts);

  // Creates the schema if absent. Throws InitError. Repeated calls are no-ops.
  void initialize();
  bool isInitialized() const { return initialized_.load(); }

  // Inserts the event and bumps its counter in one transaction.
  // Returns the new event id. Throws WriteError / NotInitializedError.
  int64_t recordEvent(const PullEvent& ev);

  // Counters ordered by image; only the matching one when image is set.
  // Throws ReadError / NotInitializedError.
  std::vector<Counter> queryCounters(const std::optional<std::string>& image = std::nullopt) const;

  // Newest first.
  std::vector<PullEvent> recentEvents(int limit) const;
  std::optional<PullEvent> findEvent(int64_t id) const;

  // Round-trips a trivial query. Never throws.
  bool healthCheck() const noexcept;

  const std::string& dbPath() const { return opts_.dbPath; }

private:
  sqlite::DbHandle connect() const;

  StoreOptions      opts_;
  std::atomic<bool> initialized_{false};
};

} // namespace ipe
