#include "http_handler.hpp"
#include "core/Errors.hpp"
#include "debug/json_debug.hpp"
#include "models/TrackInput.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void send_error(httplib::Response &res, int status, const std::string &stage,
                const std::string &message) {
  json err = {{"ok", false}, {"stage", stage}, {"error", message}};
  res.status = status;
  res.set_content(err.dump(), "application/json");
}

} // namespace

// ===== routes =====

void HttpHandler::callPostHandler(const std::string &action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action == "analyze_surface") {
    handleAnalyzeSurface(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

void HttpHandler::callGetHandler(const std::string &action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "health") {
    handleHealth(req, res);
  } else if (action == "weights") {
    handleWeights(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

// ===== POST: /analyze_surface =====

void HttpHandler::handleAnalyzeSurface(const httplib::Request &req,
                                       httplib::Response &res) {
  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error &e) {
    res.status = 400;
    res.set_content(parse_error_json(req.body, e).dump(), "application/json");
    return;
  }

  const bool with_stats =
      req.has_param("stats") && req.get_param_value("stats") == "true";

  SurfaceAnalyzer analyzer = analyzer_;
  if (body.is_object() && body.contains("params")) {
    try {
      analyzer.setParams(
          AnalysisParams::from_json(body["params"], analyzer_.params()));
    } catch (const std::exception &e) {
      send_error(res, 400, "params", e.what());
      return;
    }
  }

  try {
    Track track = parse_track(body);
    AnalysisResult result = analyzer.analyze(track.points, geodata_);
    res.status = 200;
    res.set_content(to_json(result, with_stats).dump(), "application/json");
  } catch (const InputError &e) {
    std::cerr << "[http] rejected track: " << e.what() << "\n";
    send_error(res, 400, e.stage(), e.what());
  } catch (const GeodataUnavailable &e) {
    std::cerr << "[http] " << e.what() << "\n";
    send_error(res, 503, e.stage(), "External service temporarily unavailable");
  } catch (const std::exception &e) {
    std::cerr << "[http] EXCEPTION: " << e.what() << "\n";
    send_error(res, 500, "internal", "Internal server error");
  }
}

// ===== GET =====

void HttpHandler::handleHealth(const httplib::Request &,
                               httplib::Response &res) {
  res.status = 200;
  res.set_content(R"({"ok":true})", "application/json");
}

void HttpHandler::handleWeights(const httplib::Request &,
                                httplib::Response &res) {
  json out = {{"ok", true}, {"weights", analyzer_.scorer().tableJson()}};
  res.status = 200;
  res.set_content(out.dump(), "application/json");
}
