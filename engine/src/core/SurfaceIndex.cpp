// SurfaceIndex buckets way edges into grid cells so the matcher only measures
// against edges near the query point instead of every way in the region.

#include "core/SurfaceIndex.hpp"
#include "core/GeoUtils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

SurfaceIndex::SurfaceIndex(std::vector<TaggedWay> ways, double cell_m)
    : ways_(std::move(ways)) {
  if (!(cell_m > 0.0) || !std::isfinite(cell_m))
    cell_m = 100.0;
  cell_m = std::max(cell_m, kMinCellM);

  // Cell width in longitude is fixed at the latitude of the data's centre;
  // queries convert their radius at their own latitude, so a cell is never
  // narrower than the search window assumes.
  double min_lat = 90.0, max_lat = -90.0;
  for (const auto &w : ways_) {
    for (const auto &v : w.geometry) {
      min_lat = std::min(min_lat, v.lat);
      max_lat = std::max(max_lat, v.lat);
    }
  }
  const double lat0 = (min_lat <= max_lat) ? (min_lat + max_lat) * 0.5 : 0.0;
  cell_deg_lat_ = cell_m / GeoUtils::kMetersPerDegLat;
  cell_deg_lon_ = cell_m / GeoUtils::metersPerDegLon(lat0);

  for (uint32_t wi = 0; wi < ways_.size(); ++wi) {
    const auto &g = ways_[wi].geometry;
    for (uint32_t vi = 0; vi + 1 < g.size(); ++vi) {
      const auto &a = g[vi];
      const auto &b = g[vi + 1];
      const auto edge_id = static_cast<uint32_t>(edges_.size());
      edges_.push_back(Edge{wi, vi});

      const int64_t x0 = cellX(std::min(a.lon, b.lon));
      const int64_t x1 = cellX(std::max(a.lon, b.lon));
      const int64_t y0 = cellY(std::min(a.lat, b.lat));
      const int64_t y1 = cellY(std::max(a.lat, b.lat));
      min_cx_ = std::min(min_cx_, x0);
      max_cx_ = std::max(max_cx_, x1);
      min_cy_ = std::min(min_cy_, y0);
      max_cy_ = std::max(max_cy_, y1);

      const double span = static_cast<double>(x1 - x0 + 1) *
                          static_cast<double>(y1 - y0 + 1);
      if (span > kMaxCellsPerEdge) {
        wide_edges_.push_back(edge_id);
        continue;
      }
      for (int64_t cx = x0; cx <= x1; ++cx)
        for (int64_t cy = y0; cy <= y1; ++cy)
          cells_[key(cx, cy)].push_back(edge_id);
    }
  }
}

int64_t SurfaceIndex::cellX(double lon) const {
  return static_cast<int64_t>(std::floor(lon / cell_deg_lon_));
}

int64_t SurfaceIndex::cellY(double lat) const {
  return static_cast<int64_t>(std::floor(lat / cell_deg_lat_));
}

bool SurfaceIndex::nearest(const Coordinate &p, double max_distance_m,
                           Hit &hit) const {
  if (edges_.empty() || !(max_distance_m >= 0.0))
    return false;

  // Search window in cell units, clamped to the indexed extent before it is
  // turned into integers; an unbounded radius then costs at most the grid.
  const double dlat = max_distance_m / GeoUtils::kMetersPerDegLat;
  const double dlon = max_distance_m / GeoUtils::metersPerDegLon(p.lat);
  const double fx0 = std::max(std::floor((p.lon - dlon) / cell_deg_lon_),
                              static_cast<double>(min_cx_));
  const double fx1 = std::min(std::floor((p.lon + dlon) / cell_deg_lon_),
                              static_cast<double>(max_cx_));
  const double fy0 = std::max(std::floor((p.lat - dlat) / cell_deg_lat_),
                              static_cast<double>(min_cy_));
  const double fy1 = std::min(std::floor((p.lat + dlat) / cell_deg_lat_),
                              static_cast<double>(max_cy_));
  if (fx0 > fx1 || fy0 > fy1)
    return false;

  std::vector<uint32_t> candidates;
  const double window = (fx1 - fx0 + 1.0) * (fy1 - fy0 + 1.0);
  if (window > static_cast<double>(edges_.size())) {
    // walking the window would cost more than measuring every edge
    candidates.resize(edges_.size());
    for (uint32_t eid = 0; eid < candidates.size(); ++eid)
      candidates[eid] = eid;
  } else {
    const auto x0 = static_cast<int64_t>(fx0), x1 = static_cast<int64_t>(fx1);
    const auto y0 = static_cast<int64_t>(fy0), y1 = static_cast<int64_t>(fy1);
    for (int64_t cx = x0; cx <= x1; ++cx) {
      for (int64_t cy = y0; cy <= y1; ++cy) {
        auto it = cells_.find(key(cx, cy));
        if (it != cells_.end())
          candidates.insert(candidates.end(), it->second.begin(),
                            it->second.end());
      }
    }
    candidates.insert(candidates.end(), wide_edges_.begin(), wide_edges_.end());
  }
  if (candidates.empty())
    return false;

  // Edge ids were issued in way order, so sorting them also sorts by way and
  // the strict "<" below keeps the earliest way on ties.
  std::sort(candidates.begin(), candidates.end());
  candidates.erase(std::unique(candidates.begin(), candidates.end()),
                   candidates.end());

  double best = std::numeric_limits<double>::infinity();
  std::size_t best_way = 0;
  for (uint32_t eid : candidates) {
    const Edge &e = edges_[eid];
    const auto &g = ways_[e.way_idx].geometry;
    const double d =
        GeoUtils::pointToSegmentDistance(p, g[e.vertex], g[e.vertex + 1]);
    if (d < best - kTieEpsilonM) {
      best = d;
      best_way = e.way_idx;
    }
  }

  if (!(best <= max_distance_m))
    return false;
  hit = Hit{best_way, best};
  return true;
}

const TaggedWay *SurfaceIndex::nearestWay(const Coordinate &p,
                                          double max_distance_m) const {
  Hit hit{};
  if (!nearest(p, max_distance_m, hit))
    return nullptr;
  return &ways_[hit.way_idx];
}
