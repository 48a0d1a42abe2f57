// OverpassClient posts a bbox query and decodes the tagged way geometries.

#include "OverpassClient.hpp"
#include "core/Errors.hpp"
#include "models/OverpassResponse.hpp"

#include "httplib.h"
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

std::string OverpassClient::build_query(const BBox &b, int timeout_s) {
  std::ostringstream q;
  q << std::fixed << std::setprecision(7);
  q << "[out:json][timeout:" << timeout_s << "];\n"
    << "(\n"
    << "  way(" << b.min_lat << "," << b.min_lon << "," << b.max_lat << ","
    << b.max_lon << ")[\"surface\"];\n"
    << ");\n"
    << "out geom;\n";
  return q.str();
}

std::vector<TaggedWay> OverpassClient::fetch_ways(const BBox &bbox) {
  httplib::Client cli(settings_.url);
  cli.set_connection_timeout(settings_.timeout_s, 0);
  cli.set_read_timeout(settings_.timeout_s, 0);
  cli.set_write_timeout(settings_.timeout_s, 0);

  const std::string query = build_query(bbox, settings_.timeout_s);
  auto res = cli.Post(settings_.path, query, "text/plain");
  if (!res) {
    throw GeodataError("Overpass request failed: " +
                       httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    throw GeodataError("Overpass returned HTTP " +
                       std::to_string(res->status));
  }

  OverpassResponse parsed;
  try {
    parsed = nlohmann::json::parse(res->body).get<OverpassResponse>();
  } catch (const std::exception &e) {
    throw GeodataError(std::string("Overpass response unreadable: ") +
                       e.what());
  }

  auto ways = to_tagged_ways(parsed);
  std::cout << "[overpass] " << parsed.elements.size() << " elements, "
            << ways.size() << " usable ways" << std::endl;
  return ways;
}
