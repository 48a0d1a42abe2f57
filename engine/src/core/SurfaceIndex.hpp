#pragma once
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <unordered_map>
#include <vector>

//------------------------------------------------------------------------------
// SurfaceIndex: uniform lat/lon grid over the edges of every TaggedWay fetched
// for one analysis. Built once, read-only afterwards, so any number of matcher
// threads may query it concurrently.
//------------------------------------------------------------------------------
class SurfaceIndex {
public:
  // Ways equidistant from a query point within this many metres are treated
  // as a tie and resolved by fetch order.
  static constexpr double kTieEpsilonM = 1e-6;

  // Finer cells are widened to this edge length.
  static constexpr double kMinCellM = 10.0;

  // Edges whose bounding box covers more cells than this are kept in one
  // list checked by every query instead of being copied into each cell.
  static constexpr double kMaxCellsPerEdge = 4096.0;

  struct Hit {
    std::size_t way_idx; // position in fetch order
    double distance_m;
  };

  explicit SurfaceIndex(std::vector<TaggedWay> ways, double cell_m = 100.0);

  // Nearest way within `max_distance_m` of `p`, or nullptr.
  const TaggedWay *nearestWay(const Coordinate &p,
                              double max_distance_m) const;

  // Same lookup, also reporting which way and how far.
  bool nearest(const Coordinate &p, double max_distance_m, Hit &hit) const;

  const std::vector<TaggedWay> &ways() const noexcept { return ways_; }
  std::size_t edgeCount() const noexcept { return edges_.size(); }
  std::size_t cellCount() const noexcept { return cells_.size(); }
  std::size_t wideEdgeCount() const noexcept { return wide_edges_.size(); }

private:
  struct Edge {
    uint32_t way_idx;
    uint32_t vertex; // edge runs geometry[vertex] -> geometry[vertex + 1]
  };

  int64_t cellX(double lon) const;
  int64_t cellY(double lat) const;
  static int64_t key(int64_t cx, int64_t cy) {
    return static_cast<int64_t>((static_cast<uint64_t>(cx) << 32) ^
                                (static_cast<uint64_t>(cy) & 0xffffffffULL));
  }

  std::vector<TaggedWay> ways_;
  std::vector<Edge> edges_;
  std::unordered_map<int64_t, std::vector<uint32_t>> cells_; // cell -> edges
  std::vector<uint32_t> wide_edges_;
  int64_t min_cx_ = std::numeric_limits<int64_t>::max();
  int64_t max_cx_ = std::numeric_limits<int64_t>::min();
  int64_t min_cy_ = std::numeric_limits<int64_t>::max();
  int64_t max_cy_ = std::numeric_limits<int64_t>::min();
  double cell_deg_lat_ = 0.0;
  double cell_deg_lon_ = 0.0;
};
