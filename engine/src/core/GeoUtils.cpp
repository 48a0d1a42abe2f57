#include "core/GeoUtils.hpp"

#include <algorithm>
#include <cmath>

namespace {
constexpr double kPi = 3.14159265358979323846;
inline double deg2rad(double d) { return d * kPi / 180.0; }
} // namespace

double GeoUtils::haversine(double lat1, double lon1, double lat2,
                           double lon2) {
  const double phi1 = deg2rad(lat1);
  const double phi2 = deg2rad(lat2);
  const double delta_phi = deg2rad(lat2 - lat1);
  const double delta_lambda = deg2rad(lon2 - lon1);
  const double h = std::pow(std::sin(delta_phi / 2), 2) +
                   std::cos(phi1) * std::cos(phi2) *
                       std::pow(std::sin(delta_lambda / 2), 2);
  return 2 * kEarthRadiusM * std::asin(std::sqrt(std::min(1.0, h)));
}

double GeoUtils::haversine(const Coordinate &p1, const Coordinate &p2) {
  return haversine(p1.lat, p1.lon, p2.lat, p2.lon);
}

double GeoUtils::pointToSegmentDistance(const Coordinate &p,
                                        const Coordinate &a,
                                        const Coordinate &b) {
  // local ENU-ish plane, origin at p
  const double kx = metersPerDegLon(p.lat);
  const double ky = kMetersPerDegLat;
  const double ax = (a.lon - p.lon) * kx, ay = (a.lat - p.lat) * ky;
  const double bx = (b.lon - p.lon) * kx, by = (b.lat - p.lat) * ky;
  const double dx = bx - ax, dy = by - ay;
  const double len_sq = dx * dx + dy * dy;

  double t = 0.0;
  if (len_sq > 1e-12)
    t = std::clamp(-(ax * dx + ay * dy) / len_sq, 0.0, 1.0);

  const Coordinate closest{a.lat + t * (b.lat - a.lat),
                           a.lon + t * (b.lon - a.lon)};
  return haversine(p, closest);
}

Coordinate GeoUtils::midpoint(const Coordinate &a, const Coordinate &b) {
  return Coordinate{(a.lat + b.lat) * 0.5, (a.lon + b.lon) * 0.5};
}

double GeoUtils::trackLength(const std::vector<Trackpoint> &pts) {
  double total = 0.0;
  for (std::size_t i = 1; i < pts.size(); ++i)
    total += haversine(pts[i - 1].coord, pts[i].coord);
  return total;
}

BBox GeoUtils::compute_bbox(const std::vector<Trackpoint> &pts) {
  BBox b{+90, +180, -90, -180};
  for (const auto &p : pts) {
    b.min_lat = std::min(b.min_lat, p.coord.lat);
    b.max_lat = std::max(b.max_lat, p.coord.lat);
    b.min_lon = std::min(b.min_lon, p.coord.lon);
    b.max_lon = std::max(b.max_lon, p.coord.lon);
  }
  return b;
}

BBox GeoUtils::inflate_bbox(const BBox &b, double pad_m) {
  const double lat0 = (b.min_lat + b.max_lat) * 0.5;
  const double dlat = pad_m / kMetersPerDegLat;
  const double dlon = pad_m / metersPerDegLon(lat0);
  return BBox{std::max(-90.0, b.min_lat - dlat),
              std::max(-180.0, b.min_lon - dlon),
              std::min(90.0, b.max_lat + dlat),
              std::min(180.0, b.max_lon + dlon)};
}

double GeoUtils::metersPerDegLon(double lat) {
  return kMetersPerDegLat * std::max(0.01, std::cos(deg2rad(lat)));
}
