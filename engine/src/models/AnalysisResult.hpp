#pragma once

#include "models/SurfaceTypes.hpp"
#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>

using Json = nlohmann::json;

// Classification of one track segment (consecutive trackpoint pair).
struct SegmentMatch {
  double length_m = 0.0;
  SurfaceType surface = SurfaceType::Unknown;
};

// Accumulated metres per surface. Only labels actually encountered appear.
// Ordered by enum value so iteration and serialisation are deterministic.
using SurfaceLengthMap = std::map<SurfaceType, double>;

struct SuitabilityScores {
  double roadbike = 0.0;
  double gravelbike = 0.0;
};

struct ElevationResult {
  double up = 0.0;   // metres, >= 0
  double down = 0.0; // metres, >= 0
};

// Diagnostics about a single run; not part of the compatibility surface.
struct AnalysisStats {
  std::size_t point_count = 0;
  std::size_t segment_count = 0;
  std::size_t ways_fetched = 0;
  double total_length_m = 0.0;
  bool degraded = false; // geodata unavailable, everything "unknown"
};

struct AnalysisResult {
  SurfaceLengthMap surface_lengths; // metres internally
  SuitabilityScores suitability;
  ElevationResult elevation;
  AnalysisStats stats;
};

// Wire format used by existing consumers:
// {"surface_lengths_km":{...},"suitability_scores":{...},"elevation":{...}}
// Rounding happens only here.
Json to_json(const AnalysisResult &r, bool with_stats = false);
