#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

// Spherical-earth helpers. All distances are metres, all angles degrees.
class GeoUtils {
public:
  static constexpr double kEarthRadiusM = 6371000.0;
  // metres spanned by one degree of latitude on the sphere above
  static constexpr double kMetersPerDegLat =
      kEarthRadiusM * 3.14159265358979323846 / 180.0;

  // haversine formulas
  static double haversine(double lat1, double lon1, double lat2, double lon2);
  static double haversine(const Coordinate &p1, const Coordinate &p2);

  // Shortest distance from `p` to the segment [a, b]. The segment is
  // projected into a local tangent plane centred on `p`, the closest point is
  // found there and the final distance measured with haversine.
  static double pointToSegmentDistance(const Coordinate &p, const Coordinate &a,
                                       const Coordinate &b);

  static Coordinate midpoint(const Coordinate &a, const Coordinate &b);

  // Sum of consecutive haversine distances.
  static double trackLength(const std::vector<Trackpoint> &pts);

  static BBox compute_bbox(const std::vector<Trackpoint> &pts);
  static BBox inflate_bbox(const BBox &b, double pad_m);

  // Metres per degree of longitude at `lat`, floored so polar latitudes do
  // not collapse to zero.
  static double metersPerDegLon(double lat);
};
