#include "models/TrackInput.hpp"
#include "core/Errors.hpp"

#include <cmath>
#include <string>

using Json = nlohmann::json;

namespace {

std::optional<double> parse_elevation(const Json &x) {
  if (x.is_number())
    return x.get<double>();
  if (x.is_string()) {
    try {
      return std::stod(x.get<std::string>());
    } catch (const std::exception &) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

double require_number(const Json &j, const char *key, std::size_t idx) {
  if (!j.contains(key) || !j[key].is_number())
    throw InputError("point " + std::to_string(idx) + ": missing numeric '" +
                     key + "'");
  return j[key].get<double>();
}

void push_point(Track &t, double lat, double lon, std::optional<double> ele) {
  Trackpoint p;
  p.coord = {lat, lon};
  p.ele = ele;
  p.index = t.points.size();
  t.points.push_back(p);
}

void parse_points(const Json &arr, Track &t) {
  for (const auto &pt : arr) {
    if (!pt.is_object())
      throw InputError("point " + std::to_string(t.points.size()) +
                       " is not an object");
    const double lat = require_number(pt, "lat", t.points.size());
    const double lon = require_number(pt, "lon", t.points.size());
    std::optional<double> ele;
    if (pt.contains("ele"))
      ele = parse_elevation(pt["ele"]);
    else if (pt.contains("elv"))
      ele = parse_elevation(pt["elv"]);
    else if (pt.contains("elevation"))
      ele = parse_elevation(pt["elevation"]);
    push_point(t, lat, lon, ele);
  }
}

// [lon, lat(, ele)] positions
void parse_positions(const Json &coords, Track &t) {
  for (const auto &c : coords) {
    if (!c.is_array() || c.size() < 2 || !c[0].is_number() ||
        !c[1].is_number())
      throw InputError("position " + std::to_string(t.points.size()) +
                       " must be [lon, lat(, ele)]");
    std::optional<double> ele;
    if (c.size() >= 3)
      ele = parse_elevation(c[2]);
    push_point(t, c[1].get<double>(), c[0].get<double>(), ele);
  }
}

void parse_geometry(const Json &g, Track &t) {
  const std::string type = g.value("type", "");
  const Json coords = g.value("coordinates", Json::array());
  if (type == "LineString") {
    parse_positions(coords, t);
  } else if (type == "MultiLineString") {
    for (const auto &line : coords)
      parse_positions(line, t);
  } else {
    throw InputError("unsupported geometry type '" + type + "'");
  }
}

} // namespace

Track parse_track(const Json &body) {
  Track t;
  if (!body.is_object())
    throw InputError("track body must be a JSON object");

  if (body.contains("points")) {
    if (!body["points"].is_array())
      throw InputError("'points' must be an array");
    parse_points(body["points"], t);
  } else {
    const std::string type = body.value("type", "");
    if (type == "Feature" && body.contains("geometry") &&
        body["geometry"].is_object())
      parse_geometry(body["geometry"], t);
    else if (type == "LineString" || type == "MultiLineString")
      parse_geometry(body, t);
    else
      throw InputError("expected 'points' array or GeoJSON line geometry");
  }
  validate_track(t);
  return t;
}

void validate_track(const Track &track) {
  if (track.points.empty())
    throw InputError("No track points found");
  for (const auto &p : track.points) {
    const auto &c = p.coord;
    if (!std::isfinite(c.lat) || !std::isfinite(c.lon) || c.lat < -90.0 ||
        c.lat > 90.0 || c.lon < -180.0 || c.lon > 180.0)
      throw InputError("point " + std::to_string(p.index) +
                       ": coordinate out of range (" + std::to_string(c.lat) +
                       ", " + std::to_string(c.lon) + ")");
  }
}
