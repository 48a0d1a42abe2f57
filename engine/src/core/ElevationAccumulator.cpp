#include "core/ElevationAccumulator.hpp"

#include <cmath>

void ElevationAccumulator::add(std::optional<double> ele) {
  if (!ele || !std::isfinite(*ele))
    return;
  if (last_) {
    const double delta = *ele - *last_;
    if (std::fabs(delta) >= noise_m_) {
      if (delta > 0)
        result_.up += delta;
      else
        result_.down += -delta;
    }
  }
  last_ = ele;
}

ElevationResult
ElevationAccumulator::accumulate(const std::vector<Trackpoint> &pts,
                                 double noise_m) {
  ElevationAccumulator acc(noise_m);
  for (const auto &p : pts)
    acc.add(p.ele);
  return acc.result();
}
