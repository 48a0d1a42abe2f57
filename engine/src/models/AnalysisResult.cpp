#include "models/AnalysisResult.hpp"

#include <cmath>

namespace {
double round_to(double v, int decimals) {
  const double f = std::pow(10.0, decimals);
  return std::round(v * f) / f;
}
} // namespace

Json to_json(const AnalysisResult &r, bool with_stats) {
  Json lengths = Json::object();
  for (const auto &[surface, metres] : r.surface_lengths)
    lengths[SurfaceTypeToString(surface)] = round_to(metres / 1000.0, 3);

  Json out = {
      {"surface_lengths_km", lengths},
      {"suitability_scores",
       {{"roadbike", round_to(r.suitability.roadbike, 2)},
        {"gravelbike", round_to(r.suitability.gravelbike, 2)}}},
      {"elevation",
       {{"elevation_up", round_to(r.elevation.up, 2)},
        {"elevation_down", round_to(r.elevation.down, 2)}}}};

  if (with_stats) {
    out["stats"] = {{"points", r.stats.point_count},
                    {"segments", r.stats.segment_count},
                    {"ways_fetched", r.stats.ways_fetched},
                    {"total_length_km", round_to(r.stats.total_length_m / 1000.0, 3)},
                    {"degraded", r.stats.degraded}};
  }
  return out;
}
