#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <thread>

// What to do when the geodata source stays unreachable after its retry.
enum class GeodataPolicy : uint8_t {
  Fail,   // whole analysis fails
  Degrade // continue with zero ways: every segment becomes "unknown"
};

inline const char *GeodataPolicyToString(GeodataPolicy p) {
  return p == GeodataPolicy::Degrade ? "degrade" : "fail";
}

// Bounds on request-supplied tunables. Outside them the grid index and the
// geodata query grow without limit.
inline constexpr double kMaxMatchToleranceM = 5000.0;
inline constexpr double kMaxBboxPadM = 5000.0;
inline constexpr double kMinIndexCellM = 10.0;
inline constexpr double kMaxIndexCellM = 100000.0;

// Matcher workers per request: one per hardware thread.
inline unsigned MaxMatcherThreads() {
  return std::max(1u, std::thread::hardware_concurrency());
}

// Tunables of one analysis run. Defaults are what `config/settings.json`
// ships with.
struct AnalysisParams {
  double match_tolerance_m = 25.0; // midpoint-to-way matching distance
  double elevation_noise_m = 0.5;  // smaller elevation steps count as flat
  double bbox_pad_m = -1.0;        // < 0: use match_tolerance_m
  double index_cell_m = 100.0;     // SurfaceIndex grid cell edge
  int geodata_retries = 1;         // extra attempts after the first, max 1
  GeodataPolicy geodata_policy = GeodataPolicy::Fail;
  unsigned matcher_threads = 1;

  double effectiveBboxPad() const {
    return bbox_pad_m < 0.0 ? match_tolerance_m : bbox_pad_m;
  }

  // Overlay keys present in `j` onto `base`.
  static AnalysisParams from_json(const nlohmann::json &j,
                                  AnalysisParams base);
};

inline AnalysisParams AnalysisParams::from_json(const nlohmann::json &j,
                                                AnalysisParams base = AnalysisParams{}) {
    AnalysisParams p = base;
    if (!j.is_object())
      return p;
    if (j.contains("match_tolerance_m"))
      p.match_tolerance_m = j.at("match_tolerance_m").get<double>();
    if (j.contains("elevation_noise_m"))
      p.elevation_noise_m = j.at("elevation_noise_m").get<double>();
    if (j.contains("bbox_pad_m"))
      p.bbox_pad_m = j.at("bbox_pad_m").get<double>();
    if (j.contains("index_cell_m"))
      p.index_cell_m = j.at("index_cell_m").get<double>();
    if (j.contains("geodata_retries"))
      p.geodata_retries = j.at("geodata_retries").get<int>();
    if (j.contains("matcher_threads"))
      p.matcher_threads = j.at("matcher_threads").get<unsigned>();
    if (j.contains("geodata_policy")) {
      const auto s = j.at("geodata_policy").get<std::string>();
      if (s == "fail")
        p.geodata_policy = GeodataPolicy::Fail;
      else if (s == "degrade")
        p.geodata_policy = GeodataPolicy::Degrade;
      else
        throw std::runtime_error("geodata_policy must be 'fail' or 'degrade', got '" + s + "'");
    }
    if (!std::isfinite(p.match_tolerance_m) || p.match_tolerance_m < 0.0 ||
        p.match_tolerance_m > kMaxMatchToleranceM)
      throw std::runtime_error("match_tolerance_m must be within [0, " +
                               std::to_string(static_cast<long>(kMaxMatchToleranceM)) + "]");
    if (!std::isfinite(p.elevation_noise_m) || p.elevation_noise_m < 0.0)
      throw std::runtime_error("elevation_noise_m must be finite and non-negative");
    if (!std::isfinite(p.bbox_pad_m) || p.bbox_pad_m > kMaxBboxPadM)
      throw std::runtime_error("bbox_pad_m must be at most " +
                               std::to_string(static_cast<long>(kMaxBboxPadM)));
    if (!std::isfinite(p.index_cell_m) || p.index_cell_m < kMinIndexCellM ||
        p.index_cell_m > kMaxIndexCellM)
      throw std::runtime_error("index_cell_m must be within [" +
                               std::to_string(static_cast<long>(kMinIndexCellM)) + ", " +
                               std::to_string(static_cast<long>(kMaxIndexCellM)) + "]");
    if (p.geodata_retries < 0)
      p.geodata_retries = 0;
    if (p.geodata_retries > 1)
      p.geodata_retries = 1;
    p.matcher_threads = std::clamp(p.matcher_threads, 1u, MaxMatcherThreads());
    return p;
}
