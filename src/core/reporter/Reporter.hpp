#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/model/PullEvent.hpp"

namespace ipe {

class PullStore;

// Read side: turns store state into the JSON the monitoring system polls.
class Reporter {
public:
  explicit Reporter(const PullStore& store) : store_(store) {}

  // {"<image>": {"total": n, "success": n, "failure": n, "lastSeen": unix_s}, ...}
  // Keys are sorted, so identical store state yields identical output.
  nlohmann::json report(const std::optional<std::string>& image = std::nullopt) const;

  nlohmann::json recent(int limit) const;
  std::optional<nlohmann::json> event(int64_t id) const;

  static nlohmann::json to_json(const PullEvent& ev);

private:
  const PullStore& store_;
};

} // namespace ipe
