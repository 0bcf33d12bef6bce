#pragma once
#include <cstddef>
#include <string>

namespace ipe {

struct AppConfig {
  std::string env = "development";
  std::string host = "0.0.0.0";
  int         port = 8080;
  std::string dbPath = "data/imgpull-metrics.db";
  std::string schemaPath;          // empty = search CWD, then the source tree
  int         workers = 8;
  int         httpTimeoutSec = 10;
  size_t      maxBodyBytes = 4096;
  int         busyTimeoutMs = 5000;
  std::string logLevel = "info";

  // Reads IPE_* variables, falling back to the defaults above.
  // Throws ConfigError on malformed or out-of-range values.
  static AppConfig from_env();

  void validate() const;
};

std::string get_env_or(const char* key, const std::string& defval);

// Accepts "sqlite://path" as well as a bare path.
std::string strip_sqlite_scheme(const std::string& url);

// IPE_SCHEMA_PATH if set, else schema.sql in CWD, else src/core/store/schema.sql.
std::string find_schema_path(const AppConfig& cfg);

} // namespace ipe
