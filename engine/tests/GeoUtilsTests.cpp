#include "TestFixtures.hpp"
#include "TestMacros.hpp"
#include "core/GeoUtils.hpp"

namespace {

constexpr double kMilliDegM = 111.19492664; // 0.001 deg of arc on R=6371 km

void TestHaversine() {
  EXPECT_NEAR(GeoUtils::haversine({0, 0}, {0, 0.001}), kMilliDegM, 1e-6);
  EXPECT_NEAR(GeoUtils::haversine({0, 0}, {0.001, 0}), kMilliDegM, 1e-6);
  EXPECT_NEAR(GeoUtils::haversine({47.1, 8.1}, {47.1, 8.1}), 0.0, 1e-12);

  // symmetric
  const Coordinate a{47.123, 8.123}, b{47.125, 8.125};
  EXPECT_NEAR(GeoUtils::haversine(a, b), GeoUtils::haversine(b, a), 1e-9);

  // east-west distances shrink with cos(lat)
  const double at60 = GeoUtils::haversine({60, 0}, {60, 0.001});
  EXPECT_NEAR(at60, kMilliDegM * 0.5, 1e-3);
}

void TestPointToSegment() {
  const Coordinate a{0, 0}, b{0, 0.001};

  // perpendicular foot inside the segment
  EXPECT_NEAR(GeoUtils::pointToSegmentDistance({0.0001, 0.0005}, a, b),
              kMilliDegM / 10.0, 1e-3);
  // on the segment
  EXPECT_NEAR(GeoUtils::pointToSegmentDistance({0, 0.0007}, a, b), 0.0, 1e-6);
  // beyond the end: distance to the nearer endpoint
  EXPECT_NEAR(GeoUtils::pointToSegmentDistance({0, 0.002}, a, b), kMilliDegM,
              1e-3);
  EXPECT_NEAR(GeoUtils::pointToSegmentDistance({0, -0.001}, a, b), kMilliDegM,
              1e-3);
  // degenerate segment behaves like a point
  EXPECT_NEAR(GeoUtils::pointToSegmentDistance({0.001, 0}, a, a), kMilliDegM,
              1e-3);
  // direction of the segment does not matter
  const Coordinate p{0.0003, 0.0002};
  EXPECT_NEAR(GeoUtils::pointToSegmentDistance(p, a, b),
              GeoUtils::pointToSegmentDistance(p, b, a), 1e-9);
}

void TestMidpointAndLength() {
  const Coordinate m = GeoUtils::midpoint({0, 0}, {0.002, 0.004});
  EXPECT_NEAR(m.lat, 0.001, 1e-12);
  EXPECT_NEAR(m.lon, 0.002, 1e-12);

  EXPECT_NEAR(GeoUtils::trackLength(equator_track(3, 0.001)), 2 * kMilliDegM,
              1e-6);
  EXPECT_NEAR(GeoUtils::trackLength(equator_track(1, 0.001)), 0.0, 0.0);
  EXPECT_NEAR(GeoUtils::trackLength({}), 0.0, 0.0);
}

void TestBbox() {
  const auto pts = make_track({{47.2, 8.5}, {47.1, 8.7}, {47.3, 8.6}});
  const BBox b = GeoUtils::compute_bbox(pts);
  EXPECT_NEAR(b.min_lat, 47.1, 1e-12);
  EXPECT_NEAR(b.max_lat, 47.3, 1e-12);
  EXPECT_NEAR(b.min_lon, 8.5, 1e-12);
  EXPECT_NEAR(b.max_lon, 8.7, 1e-12);

  const BBox eq = GeoUtils::compute_bbox(equator_track(2, 0.001));
  const BBox padded = GeoUtils::inflate_bbox(eq, kMilliDegM);
  EXPECT_NEAR(padded.min_lat, -0.001, 1e-7);
  EXPECT_NEAR(padded.max_lat, 0.001, 1e-7);
  EXPECT_NEAR(padded.min_lon, -0.001, 1e-7);
  EXPECT_NEAR(padded.max_lon, 0.002, 1e-7);

  // clamped to the valid coordinate range
  const BBox pole = GeoUtils::inflate_bbox({89.9999, 0, 90, 0}, 1000);
  EXPECT_TRUE(pole.max_lat <= 90.0);
}

} // namespace

int main() {
  TestHaversine();
  TestPointToSegment();
  TestMidpointAndLength();
  TestBbox();
  return report("geo_utils_tests");
}
