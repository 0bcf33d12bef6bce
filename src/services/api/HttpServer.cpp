#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/Errors.hpp"
#include "core/recorder/Recorder.hpp"
#include "core/reporter/Reporter.hpp"
#include "core/store/PullStore.hpp"
#include "core/util/Text.hpp"

using nlohmann::json;

// -------- helpers --------

namespace {

constexpr int kDefaultRecentLimit = 200;
constexpr int kMaxRecentLimit = 1000;
constexpr size_t kHardPayloadLimit = 1 << 20;

void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& error,
                const std::string& message = {}) {
  json body = {{"error", error}};
  if (!message.empty()) body["message"] = message;
  send_json(res, status, body);
}

// Maps store failures onto 503 (not initialized) and 500 (storage down).
template <class Fn>
void with_store(httplib::Response& res, const char* what, Fn&& fn) {
  try {
    fn();
  } catch (const ipe::NotInitializedError&) {
    spdlog::error("{}: store not initialized", what);
    send_error(res, 503, "store not initialized");
  } catch (const ipe::StoreError& e) {
    spdlog::error("{} failed: {}", what, e.what());
    send_error(res, 500, "storage unavailable");
  }
}

std::optional<std::string> image_filter(const httplib::Request& req) {
  if (!req.has_param("image")) return std::nullopt;
  std::string v = ipe::trim(req.get_param_value("image"));
  if (v.empty()) return std::nullopt;
  return v;
}

} // namespace

// -------- server --------

namespace ipe {

void configure_server(httplib::Server& svr, const ServerOptions& opts) {
  const size_t workers = static_cast<size_t>(std::max(1, opts.workers));
  svr.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

  svr.set_read_timeout(opts.timeoutSec, 0);
  svr.set_write_timeout(opts.timeoutSec, 0);
  svr.set_payload_max_length(std::max(kHardPayloadLimit, opts.maxBodyBytes));

  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} -> {}", req.method, req.path, res.status);
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    if (res.status == 404) send_error(res, 404, "not found");
    else if (res.status == 413) send_error(res, 413, "body", "request body too large");
  });

  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                               std::exception_ptr ep) {
    try {
      if (ep) std::rethrow_exception(ep);
      spdlog::error("{} {}: unknown failure", req.method, req.path);
    } catch (const std::exception& e) {
      spdlog::error("{} {}: unhandled exception: {}", req.method, req.path, e.what());
    } catch (...) {
      spdlog::error("{} {}: unhandled non-standard exception", req.method, req.path);
    }
    send_error(res, 500, "internal error");
  });
}

void register_routes(httplib::Server& svr,
                     PullStore& store,
                     Recorder& recorder,
                     const Reporter& reporter,
                     const ServerOptions& opts) {
  // Health check
  svr.Get("/health", [&store](const httplib::Request&, httplib::Response& res) {
    const bool up = store.isInitialized() && store.healthCheck();
    send_json(res, up ? 200 : 503, {{"status", up ? "ok" : "unavailable"}});
  });

  // GET /metrics?image=<ref>
  svr.Get("/metrics", [&reporter](const httplib::Request& req, httplib::Response& res) {
    with_store(res, "report", [&] {
      send_json(res, 200, reporter.report(image_filter(req)));
    });
  });

  // POST /events
  // Body: {"image": "...", "outcome": "success"|"failure", "detail": "..."}
  svr.Post("/events", [&recorder, maxBody = opts.maxBodyBytes](const httplib::Request& req,
                                                                httplib::Response& res) {
    if (req.body.size() > maxBody) {
      send_error(res, 400, "body", "request body exceeds " + std::to_string(maxBody) + " bytes");
      return;
    }
    with_store(res, "ingest", [&] {
      IngestResult r = recorder.ingest(req.body);
      if (!r.ok()) {
        spdlog::warn("rejected event: {}: {}", r.error->field, r.error->message);
        send_error(res, 400, r.error->field, r.error->message);
        return;
      }
      send_json(res, 202, Reporter::to_json(r.event));
    });
  });

  // GET /events/recent?limit=N
  svr.Get("/events/recent", [&reporter](const httplib::Request& req, httplib::Response& res) {
    int limit = kDefaultRecentLimit;
    if (req.has_param("limit")) {
      const std::string raw = req.get_param_value("limit");
      size_t used = 0;
      try {
        limit = std::stoi(raw, &used);
      } catch (const std::exception&) {
        used = 0;
      }
      if (used == 0 || used != raw.size()) {
        send_error(res, 400, "limit", "limit must be a number");
        return;
      }
      limit = std::clamp(limit, 1, kMaxRecentLimit);
    }
    with_store(res, "recent events", [&] {
      send_json(res, 200, reporter.recent(limit));
    });
  });

  // GET /events/<id>
  svr.Get(R"(/events/(\d+))", [&reporter](const httplib::Request& req, httplib::Response& res) {
    int64_t id = 0;
    try {
      id = std::stoll(req.matches[1].str());
    } catch (const std::out_of_range&) {
      send_error(res, 404, "not found");
      return;
    }
    with_store(res, "event lookup", [&] {
      auto ev = reporter.event(id);
      if (!ev) { send_error(res, 404, "not found"); return; }
      send_json(res, 200, *ev);
    });
  });
}

void run_http_server(httplib::Server& svr, const std::string& host, int port) {
  if (!svr.bind_to_port(host, port)) {
    throw std::runtime_error("Failed to bind " + host + ":" + std::to_string(port));
  }
  spdlog::info("HTTP server listening on http://{}:{}", host, port);
  if (!svr.listen_after_bind()) {
    spdlog::error("HTTP server on port {} stopped with an error", port);
  }
}

} // namespace ipe
