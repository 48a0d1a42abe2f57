#include "core/SuitabilityScorer.hpp"

#include <stdexcept>
#include <string>

SuitabilityScores
SuitabilityScorer::score(const SurfaceLengthMap &lengths) const {
  SuitabilityScores s;
  double total = 0.0;
  for (const auto &[surface, metres] : lengths)
    total += metres;
  if (!(total > 0.0))
    return s;

  for (const auto &[surface, metres] : lengths) {
    const auto &w = weight(surface);
    s.roadbike += w.roadbike * metres;
    s.gravelbike += w.gravelbike * metres;
  }
  s.roadbike /= total;
  s.gravelbike /= total;
  return s;
}

SuitabilityTable SuitabilityScorer::tableFromJson(const nlohmann::json &j) {
  SuitabilityTable table = kSurfaceSuitability;
  if (j.is_null())
    return table;
  if (!j.is_object())
    throw std::runtime_error("suitability overrides must be an object");

  for (const auto &[label, pair] : j.items()) {
    SurfaceType t;
    if (!SurfaceTypeFromLabel(label, t))
      throw std::runtime_error("Unknown surface '" + label +
                               "' in suitability overrides.");
    if (!pair.is_array() || pair.size() != 2 || !pair[0].is_number() ||
        !pair[1].is_number())
      throw std::runtime_error("Suitability for '" + label +
                               "' must be [roadbike, gravelbike].");
    table[static_cast<std::size_t>(t)] = {pair[0].get<double>(),
                                          pair[1].get<double>()};
  }
  return table;
}

nlohmann::json SuitabilityScorer::tableJson() const {
  nlohmann::json out = nlohmann::json::object();
  for (std::size_t i = 0; i < table_.size(); ++i) {
    const auto t = static_cast<SurfaceType>(i);
    out[SurfaceTypeToString(t)] = {{"roadbike", table_[i].roadbike},
                                   {"gravelbike", table_[i].gravelbike}};
  }
  return out;
}
