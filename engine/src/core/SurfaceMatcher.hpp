#pragma once
#include "core/SurfaceIndex.hpp"
#include "models/AnalysisResult.hpp"
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <vector>

// Classifies every consecutive trackpoint pair against a SurfaceIndex.
class SurfaceMatcher {
public:
  struct Params {
    double tolerance_m = 25.0; // max midpoint-to-way distance for a match
    unsigned threads = 1;      // > 1 splits the segment range across workers
  };

  SurfaceMatcher(const SurfaceIndex &index, Params p)
      : index_(index), P(p) {}

  // One entry per segment, in track order. Fewer than two points -> empty.
  std::vector<SegmentMatch> match(const std::vector<Trackpoint> &pts) const;

  SegmentMatch classify(const Trackpoint &a, const Trackpoint &b) const;

private:
  void matchRange(const std::vector<Trackpoint> &pts, std::size_t begin,
                  std::size_t end, std::vector<SegmentMatch> &out) const;

  const SurfaceIndex &index_;
  Params P;
};
