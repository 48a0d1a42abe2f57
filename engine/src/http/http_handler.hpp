#pragma once

#include "core/SurfaceAnalyzer.hpp"
#include "httplib.h"
#include "models/params.hpp"
#include <string>
#include <utility>

class GeodataSource;

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL.
class HttpHandler {
public:
  HttpHandler(GeodataSource &geodata, SurfaceAnalyzer analyzer)
      : geodata_(geodata), analyzer_(std::move(analyzer)) {}

  void callPostHandler(const std::string &action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(const std::string &action, const httplib::Request &req,
                      httplib::Response &res);

private:
  GeodataSource &geodata_;
  SurfaceAnalyzer analyzer_;

  // Individual request handlers
  void handleAnalyzeSurface(const httplib::Request &req,
                            httplib::Response &res);
  void handleHealth(const httplib::Request &req, httplib::Response &res);
  void handleWeights(const httplib::Request &req, httplib::Response &res);
};
