#pragma once
#include "models/AnalysisResult.hpp"
#include "models/SurfaceTypes.hpp"
#include <array>
#include <cstddef>
#include <nlohmann/json.hpp>

struct SuitabilityWeight {
  double roadbike;
  double gravelbike;
};

using SuitabilityTable = std::array<SuitabilityWeight, kSurfaceTypeCount>;

// How well each surface rides on a road bike / gravel bike, 0..1.
// Indexed by SurfaceType; this is the only place that encodes that judgement.
inline constexpr SuitabilityTable kSurfaceSuitability = {{
    /* asphalt       */ {1.0, 1.0},
    /* concrete      */ {1.0, 1.0},
    /* paving_stones */ {0.8, 1.0},
    /* sett          */ {0.6, 1.0},
    /* cobblestone   */ {0.5, 1.0},
    /* metal         */ {0.6, 0.8},
    /* wood          */ {0.5, 0.8},
    /* paved         */ {0.9, 1.0},
    /* compacted     */ {0.4, 1.0},
    /* gravel        */ {0.0, 1.0},
    /* fine_gravel   */ {0.0, 1.0},
    /* dirt          */ {0.0, 1.0},
    /* earth         */ {0.0, 1.0},
    /* grass         */ {0.0, 0.8},
    /* sand          */ {0.0, 0.6},
    /* mud           */ {0.0, 0.5},
    /* clay          */ {0.0, 0.8},
    /* snow          */ {0.0, 0.2},
    /* ice           */ {0.0, 0.1},
    /* unpaved       */ {0.1, 0.9},
    /* unknown       */ {0.0, 0.0},
}};

//------------------------------------------------------------------------------
// SuitabilityScorer: length-weighted average of the per-surface weights.
//------------------------------------------------------------------------------
class SuitabilityScorer {
public:
  explicit SuitabilityScorer(const SuitabilityTable &table = kSurfaceSuitability)
      : table_(table) {}

  // Build a table from the defaults with overrides of the form
  // {"gravel": [0.1, 1.0], ...}. Throws std::runtime_error on an unknown
  // label or a malformed pair.
  static SuitabilityTable tableFromJson(const nlohmann::json &j);

  SuitabilityScores score(const SurfaceLengthMap &lengths) const;

  const SuitabilityWeight &weight(SurfaceType t) const {
    return table_[static_cast<std::size_t>(t)];
  }
  const SuitabilityTable &table() const noexcept { return table_; }

  nlohmann::json tableJson() const;

private:
  SuitabilityTable table_;
};
