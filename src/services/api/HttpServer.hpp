#pragma once
#include <cstddef>
#include <string>

namespace httplib { class Server; }

namespace ipe {

class PullStore;
class Recorder;
class Reporter;

struct ServerOptions {
  size_t maxBodyBytes = 4096;
  int    workers = 8;
  int    timeoutSec = 10;
};

// Thread pool, timeouts, access log, JSON 404/500 fallbacks.
void configure_server(httplib::Server& svr, const ServerOptions& opts);

// GET /health, GET /metrics, POST /events, GET /events/recent, GET /events/<id>
void register_routes(httplib::Server& svr,
                     PullStore& store,
                     Recorder& recorder,
                     const Reporter& reporter,
                     const ServerOptions& opts);

// Blocks until svr.stop(). Throws std::runtime_error if the port cannot be bound.
void run_http_server(httplib::Server& svr, const std::string& host, int port);

}
