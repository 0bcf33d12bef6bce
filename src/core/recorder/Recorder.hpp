#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "core/Errors.hpp"
#include "core/model/PullEvent.hpp"

namespace ipe {

class PullStore;

struct IngestResult {
  std::optional<ValidationError> error;
  PullEvent event; // as stored, id included; meaningful only when ok()

  bool ok() const { return !error.has_value(); }
};

// Validates raw pull reports and hands well-formed events to the store.
class Recorder {
public:
  using Clock = std::function<int64_t()>; // unix seconds

  explicit Recorder(PullStore& store, Clock clock = {});

  // rawReport is a JSON object:
  //   {"image": "...", "outcome": "success"|"failure",
  //    "detail": "...", "timestamp": <unix s>, "durationMs": n, "bytes": n}
  // Only image and outcome are required. Exactly one store write happens
  // when the result is ok(), none otherwise. WriteError and
  // NotInitializedError from the store propagate unchanged.
  IngestResult ingest(const std::string& rawReport);

private:
  PullStore& store_;
  Clock      clock_;
};

} // namespace ipe
