#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ipe {

enum class Outcome {
  Success,
  Failure
};

inline const char* to_string(Outcome o) {
  switch (o) {
    case Outcome::Success: return "success";
    case Outcome::Failure: return "failure";
  }
  return "failure";
}

// Case-insensitive; nullopt for anything that is not a known outcome.
std::optional<Outcome> parse_outcome(std::string_view s);

struct PullEvent {
  int64_t     id = 0;          // assigned by the store
  std::string image;
  std::string registry;
  Outcome     outcome = Outcome::Success;
  std::optional<std::string> detail;
  int64_t     timestamp = 0;   // unix seconds
  std::optional<int64_t> duration_ms;
  std::optional<int64_t> bytes;
};

struct Counter {
  std::string image;
  int64_t     total = 0;
  int64_t     success = 0;
  int64_t     failure = 0;
  int64_t     last_seen = 0;
};

} // namespace ipe
