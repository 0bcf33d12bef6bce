#include "Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include <spdlog/common.h>

#include "core/Errors.hpp"

namespace ipe {

namespace {

long long env_int(const char* key, long long defval, long long lo, long long hi) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  long long v = 0;
  size_t used = 0;
  try { v = std::stoll(raw, &used); }
  catch (const std::exception&) { throw ConfigError(std::string(key) + " must be a number, got '" + raw + "'"); }
  if (used != raw.size()) throw ConfigError(std::string(key) + " must be a number, got '" + raw + "'");
  if (v < lo || v > hi)
    throw ConfigError(std::string(key) + " must be between " + std::to_string(lo) +
                      " and " + std::to_string(hi));
  return v;
}

} // namespace

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

std::string strip_sqlite_scheme(const std::string& url) {
  static const std::string scheme = "sqlite://";
  if (url.compare(0, scheme.size(), scheme) == 0) return url.substr(scheme.size());
  return url;
}

AppConfig AppConfig::from_env() {
  AppConfig c;
  c.env            = get_env_or("IPE_ENV", c.env);
  c.host           = get_env_or("IPE_HOST", c.host);
  c.port           = static_cast<int>(env_int("IPE_PORT", c.port, 1, 65535));
  c.dbPath         = strip_sqlite_scheme(get_env_or("IPE_DB_PATH", c.dbPath));
  c.schemaPath     = get_env_or("IPE_SCHEMA_PATH", "");
  c.workers        = static_cast<int>(env_int("IPE_WORKERS", c.workers, 1, 64));
  c.httpTimeoutSec = static_cast<int>(env_int("IPE_HTTP_TIMEOUT_SEC", c.httpTimeoutSec, 1, 300));
  c.maxBodyBytes   = static_cast<size_t>(env_int("IPE_MAX_BODY_BYTES",
                                                 static_cast<long long>(c.maxBodyBytes), 64, 1 << 20));
  c.busyTimeoutMs  = static_cast<int>(env_int("IPE_BUSY_TIMEOUT_MS", c.busyTimeoutMs, 0, 600000));
  c.logLevel       = get_env_or("IPE_LOG_LEVEL", c.logLevel);
  c.validate();
  return c;
}

void AppConfig::validate() const {
  if (env.size() < 3) throw ConfigError("IPE_ENV must be at least 3 characters");
  if (host.empty()) throw ConfigError("IPE_HOST must not be empty");
  if (dbPath.empty()) throw ConfigError("IPE_DB_PATH must not be empty");
  if (port < 1 || port > 65535) throw ConfigError("IPE_PORT must be between 1 and 65535");
  if (workers < 1) throw ConfigError("IPE_WORKERS must be positive");
  // spdlog maps unknown names to "off"; only accept that when asked for.
  if (spdlog::level::from_str(logLevel) == spdlog::level::off && logLevel != "off")
    throw ConfigError("IPE_LOG_LEVEL '" + logLevel + "' is not a spdlog level");
}

std::string find_schema_path(const AppConfig& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schemaPath.empty()) return cfg.schemaPath;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/store/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw ConfigError("schema.sql not found (looked in CWD and src/core/store)");
}

} // namespace ipe
