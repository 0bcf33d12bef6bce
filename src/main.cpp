// src/main.cpp
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "config/Config.hpp"
#include "core/Errors.hpp"
#include "core/recorder/Recorder.hpp"
#include "core/reporter/Reporter.hpp"
#include "core/store/PullStore.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

static httplib::Server* g_server = nullptr;

static void on_signal(int) {
  if (g_server) g_server->stop();
}

static ipe::StoreOptions storeOptions(const ipe::AppConfig& cfg) {
  return ipe::StoreOptions{cfg.dbPath, ipe::find_schema_path(cfg), cfg.busyTimeoutMs};
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create SQLite schema (idempotent)\n"
            << "  " << argv0 << " --serve       # start HTTP server (IPE_PORT or 8080)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  const std::string mode = argc > 1 ? argv[1] : "";
  if (mode != "--init" && mode != "--serve") {
    print_usage(argv[0]);
    return 1;
  }

  try {
    const ipe::AppConfig cfg = ipe::AppConfig::from_env();
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));

    ipe::PullStore store(storeOptions(cfg));

    if (mode == "--init") {
      store.initialize();
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    // Self-heal DB on startup (idempotent)
    store.initialize();

    ipe::Recorder recorder(store);
    ipe::Reporter reporter(store);

    const ipe::ServerOptions opts{cfg.maxBodyBytes, cfg.workers, cfg.httpTimeoutSec};
    httplib::Server svr;
    ipe::configure_server(svr, opts);
    ipe::register_routes(svr, store, recorder, reporter, opts);

    g_server = &svr;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    spdlog::info("env={} db={} workers={}", cfg.env, cfg.dbPath, cfg.workers);
    ipe::run_http_server(svr, cfg.host, cfg.port);

    g_server = nullptr;
    spdlog::info("shutdown complete");
    return 0;
  } catch (const ipe::InitError& e) {
    spdlog::critical("database initialization failed: {}", e.what());
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
