#pragma once
#include "core/SuitabilityScorer.hpp"
#include "models/AnalysisResult.hpp"
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <string>
#include <vector>

class GeodataSource;

//------------------------------------------------------------------------------
// SurfaceAnalyzer: track in, AnalysisResult out.
//
//   bbox -> fetch ways (one retry) -> SurfaceIndex -> SurfaceMatcher
//        -> SurfaceAggregator -> SuitabilityScorer
//   elevation accumulation runs alongside and is joined before assembly.
//
// Holds no state between calls; every run owns its index and accumulators.
//------------------------------------------------------------------------------
class SurfaceAnalyzer {
public:
  explicit SurfaceAnalyzer(AnalysisParams p = AnalysisParams{},
                           SuitabilityScorer scorer = SuitabilityScorer{})
      : P(p), scorer_(scorer) {}

  void setParams(const AnalysisParams &params) { P = params; }
  const AnalysisParams &params() const noexcept { return P; }
  const SuitabilityScorer &scorer() const noexcept { return scorer_; }

  // Throws InputError for an unusable track and GeodataUnavailable when the
  // source fails twice under GeodataPolicy::Fail.
  AnalysisResult analyze(const std::vector<Trackpoint> &points,
                         GeodataSource &geodata) const;

private:
  // Returns false when every attempt failed; `error` holds the last message.
  bool fetchWithRetry(GeodataSource &geodata, const BBox &bbox,
                      std::vector<TaggedWay> &ways, std::string &error) const;

  AnalysisParams P;
  SuitabilityScorer scorer_;
};
