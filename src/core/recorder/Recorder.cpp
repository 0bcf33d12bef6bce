#include "Recorder.hpp"

#include <ctime>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/recorder/ImageReference.hpp"
#include "core/store/PullStore.hpp"
#include "core/util/Text.hpp"

using nlohmann::json;

namespace ipe {

namespace {

constexpr size_t kMaxDetailLength = 2048;

IngestResult reject(std::string field, std::string message) {
  IngestResult r;
  r.error = ValidationError{std::move(field), std::move(message)};
  return r;
}

// Absent or null -> nullopt. Present but not a non-negative integer -> false.
bool optNonNegative(const json& j, const char* key, std::optional<int64_t>& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_number_integer()) return false;
  const int64_t v = it->get<int64_t>();
  if (v < 0) return false;
  out = v;
  return true;
}

} // namespace

Recorder::Recorder(PullStore& store, Clock clock)
  : store_(store), clock_(std::move(clock)) {
  if (!clock_) clock_ = [] { return static_cast<int64_t>(std::time(nullptr)); };
}

IngestResult Recorder::ingest(const std::string& rawReport) {
  json j;
  try { j = json::parse(rawReport); }
  catch (const json::parse_error&) { return reject("body", "invalid JSON"); }
  if (!j.is_object()) return reject("body", "expected a JSON object");

  auto img = j.find("image");
  if (img == j.end() || img->is_null()) return reject("image", "image is required");
  if (!img->is_string()) return reject("image", "image must be a string");
  const std::string image = trim(img->get<std::string>());
  if (image.empty()) return reject("image", "image must not be empty");
  auto ref = parse_image_reference(image);
  if (!ref) return reject("image", "not a valid image reference: " + image);

  auto out = j.find("outcome");
  if (out == j.end() || !out->is_string())
    return reject("outcome", "outcome must be \"success\" or \"failure\"");
  auto outcome = parse_outcome(trim(out->get<std::string>()));
  if (!outcome) return reject("outcome", "outcome must be \"success\" or \"failure\"");

  PullEvent ev;
  ev.image    = image;
  ev.registry = ref->registry;
  ev.outcome  = *outcome;

  if (auto d = j.find("detail"); d != j.end() && !d->is_null()) {
    if (!d->is_string()) return reject("detail", "detail must be a string");
    std::string detail = d->get<std::string>();
    if (detail.size() > kMaxDetailLength)
      return reject("detail", "detail longer than " + std::to_string(kMaxDetailLength) + " bytes");
    ev.detail = std::move(detail);
  }

  std::optional<int64_t> ts;
  if (!optNonNegative(j, "timestamp", ts))
    return reject("timestamp", "timestamp must be non-negative unix seconds");
  ev.timestamp = ts ? *ts : clock_();

  if (!optNonNegative(j, "durationMs", ev.duration_ms))
    return reject("durationMs", "durationMs must be a non-negative integer");
  if (!optNonNegative(j, "bytes", ev.bytes))
    return reject("bytes", "bytes must be a non-negative integer");

  ev.id = store_.recordEvent(ev);
  spdlog::debug("recorded event {} image={} outcome={}", ev.id, ev.image, to_string(ev.outcome));

  IngestResult r;
  r.event = std::move(ev);
  return r;
}

} // namespace ipe
