#include "Reporter.hpp"

#include "core/store/PullStore.hpp"

using nlohmann::json;

namespace ipe {

json Reporter::report(const std::optional<std::string>& image) const {
  json out = json::object();
  for (const auto& c : store_.queryCounters(image)) {
    out[c.image] = {
      {"total",    c.total},
      {"success",  c.success},
      {"failure",  c.failure},
      {"lastSeen", c.last_seen}
    };
  }
  return out;
}

json Reporter::recent(int limit) const {
  json out = json::array();
  for (const auto& ev : store_.recentEvents(limit)) out.push_back(to_json(ev));
  return out;
}

std::optional<json> Reporter::event(int64_t id) const {
  auto ev = store_.findEvent(id);
  if (!ev) return std::nullopt;
  return to_json(*ev);
}

json Reporter::to_json(const PullEvent& ev) {
  json j = {
    {"id",        ev.id},
    {"image",     ev.image},
    {"registry",  ev.registry},
    {"outcome",   to_string(ev.outcome)},
    {"timestamp", ev.timestamp}
  };
  j["detail"]     = ev.detail      ? json(*ev.detail)      : json(nullptr);
  j["durationMs"] = ev.duration_ms ? json(*ev.duration_ms) : json(nullptr);
  j["bytes"]      = ev.bytes       ? json(*ev.bytes)       : json(nullptr);
  return j;
}

} // namespace ipe
