// SurfaceAnalyzer wires geodata fetching, matching, scoring and elevation.

#include "core/SurfaceAnalyzer.hpp"

#include "core/ElevationAccumulator.hpp"
#include "core/Errors.hpp"
#include "core/GeoUtils.hpp"
#include "core/GeodataSource.hpp"
#include "core/SurfaceAggregator.hpp"
#include "core/SurfaceIndex.hpp"
#include "core/SurfaceMatcher.hpp"
#include "models/TrackInput.hpp"

#include <future>
#include <iostream>
#include <utility>

bool SurfaceAnalyzer::fetchWithRetry(GeodataSource &geodata, const BBox &bbox,
                                     std::vector<TaggedWay> &ways,
                                     std::string &error) const {
  const int attempts = 1 + P.geodata_retries;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      ways = geodata.fetch_ways(bbox);
      return true;
    } catch (const GeodataError &e) {
      error = e.what();
      std::cerr << "[analyze] geodata attempt " << attempt << "/" << attempts
                << " failed: " << error << "\n";
    }
  }
  return false;
}

AnalysisResult SurfaceAnalyzer::analyze(const std::vector<Trackpoint> &points,
                                        GeodataSource &geodata) const {
  validate_track(Track{points});

  AnalysisResult result;
  result.stats.point_count = points.size();
  result.stats.segment_count = points.size() - 1;

  // Elevation never depends on the geodata source.
  auto elevation = std::async(std::launch::async, [&points, this] {
    return ElevationAccumulator::accumulate(points, P.elevation_noise_m);
  });

  std::vector<TaggedWay> ways;
  if (points.size() >= 2) {
    const BBox bbox = GeoUtils::inflate_bbox(GeoUtils::compute_bbox(points),
                                             P.effectiveBboxPad());
    std::string error;
    if (!fetchWithRetry(geodata, bbox, ways, error)) {
      if (P.geodata_policy == GeodataPolicy::Fail) {
        elevation.wait();
        throw GeodataUnavailable("External service temporarily unavailable: " +
                                 error);
      }
      std::cerr << "[analyze] degrading to unknown surfaces\n";
      result.stats.degraded = true;
      ways.clear();
    }
  }
  result.stats.ways_fetched = ways.size();

  const SurfaceIndex index(std::move(ways), P.index_cell_m);
  const SurfaceMatcher matcher(
      index, SurfaceMatcher::Params{P.match_tolerance_m, P.matcher_threads});
  const auto matches = matcher.match(points);

  result.surface_lengths = SurfaceAggregator::aggregate(matches);
  result.stats.total_length_m =
      SurfaceAggregator::total(result.surface_lengths);
  result.suitability = scorer_.score(result.surface_lengths);
  result.elevation = elevation.get();

  std::cout << "[analyze] " << points.size() << " points, "
            << result.stats.ways_fetched << " ways, "
            << result.stats.total_length_m / 1000.0 << " km" << std::endl;
  return result;
}
