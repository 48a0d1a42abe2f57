#pragma once
#include "models/AnalysisResult.hpp"
#include "models/CoreTypes.hpp"
#include <optional>
#include <vector>

// Running ascent/descent over an elevation sequence. Samples without
// elevation are skipped; each valid sample is compared with the previous
// valid one. Steps smaller than `noise_m` count as flat.
class ElevationAccumulator {
public:
  static constexpr double kDefaultNoiseM = 0.5;

  explicit ElevationAccumulator(double noise_m = kDefaultNoiseM)
      : noise_m_(noise_m < 0.0 ? 0.0 : noise_m) {}

  void add(std::optional<double> ele);
  const ElevationResult &result() const noexcept { return result_; }

  static ElevationResult accumulate(const std::vector<Trackpoint> &pts,
                                    double noise_m = kDefaultNoiseM);

private:
  double noise_m_;
  std::optional<double> last_;
  ElevationResult result_;
};
