#pragma once
#include "models/AnalysisResult.hpp"
#include <vector>

// Reduces per-segment classifications into metres per surface.
class SurfaceAggregator {
public:
  static SurfaceLengthMap aggregate(const std::vector<SegmentMatch> &matches);

  static double total(const SurfaceLengthMap &lengths);
};
