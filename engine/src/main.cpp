// Entry point for the route surface HTTP server.  It loads configuration,
// wires the Overpass client into the analyzer and exposes the REST endpoints
// handled by `HttpHandler`.

#include "core/SuitabilityScorer.hpp"
#include "core/SurfaceAnalyzer.hpp"
#include "http/http_handler.hpp"
#include "infra/OverpassClient.hpp"
#include <nlohmann/json.hpp>

#include <cstdio>
#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <string>
#include <unistd.h>

using json = nlohmann::json;

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

int main(int argc, char **argv) {
  install_bt_handlers();

  // ---------------------- Load configuration ------------------------------
  const std::string cfg_path = argc > 1 ? argv[1] : "config/settings.json";
  std::ifstream cfg(cfg_path);
  if (!cfg) {
    std::cerr << "[main] Cannot open " << cfg_path << "\n";
    return 1;
  }

  json settings;
  AnalysisParams params;
  SuitabilityTable weights;
  OverpassClient::Settings overpass;
  try {
    cfg >> settings;
    params = AnalysisParams::from_json(settings.value("analysis", json::object()));
    weights = SuitabilityScorer::tableFromJson(
        settings.value("suitability", json()));
    const auto op = settings.value("overpass", json::object());
    overpass.url = op.value("url", overpass.url);
    overpass.path = op.value("path", overpass.path);
    overpass.timeout_s = op.value("timeout_s", overpass.timeout_s);
  } catch (const std::exception &e) {
    std::cerr << "[main] Bad configuration in " << cfg_path << ": " << e.what()
              << "\n";
    return 1;
  }

  const json server_cfg = settings.value("server", json::object());
  const std::string host = server_cfg.value("host", "0.0.0.0");
  const int port = server_cfg.value("port", 5000);
  std::cout << "[main] tolerance " << params.match_tolerance_m
            << " m, noise " << params.elevation_noise_m << " m, policy "
            << GeodataPolicyToString(params.geodata_policy) << std::endl;

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(
      server_cfg.value("max_payload_bytes", 10ull * 1024ull * 1024ull));
  server.set_read_timeout(server_cfg.value("read_timeout_s", 60), 0);
  server.set_write_timeout(server_cfg.value("write_timeout_s", 60), 0);

  OverpassClient geodata(overpass);
  HttpHandler handler(geodata,
                      SurfaceAnalyzer(params, SuitabilityScorer(weights)));

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &ep :
       server_cfg.value("post_endpoints", json::array({"/analyze_surface"}))) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[POST] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &ep : server_cfg.value(
           "get_endpoints", json::array({"/health", "/weights"}))) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      handler.callGetHandler(action, req, res);
    });
  }

  // ---------------------- Start server ------------------------------------
  std::cout << "[main] Starting server on " << host << ":" << port
            << std::endl;
  if (!server.listen(host, port)) {
    std::cerr << "[main] Cannot listen on " << host << ":" << port << "\n";
    return 1;
  }
  return 0;
}
