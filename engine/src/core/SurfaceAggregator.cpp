#include "core/SurfaceAggregator.hpp"

SurfaceLengthMap
SurfaceAggregator::aggregate(const std::vector<SegmentMatch> &matches) {
  SurfaceLengthMap lengths;
  for (const auto &m : matches)
    lengths[m.surface] += m.length_m;
  return lengths;
}

double SurfaceAggregator::total(const SurfaceLengthMap &lengths) {
  double sum = 0.0;
  for (const auto &[surface, metres] : lengths)
    sum += metres;
  return sum;
}
