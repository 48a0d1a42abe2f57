// SurfaceMatcher assigns a surface to each track segment via its midpoint.

#include "core/SurfaceMatcher.hpp"
#include "core/GeoUtils.hpp"
#include "models/params.hpp"

#include <algorithm>
#include <future>

SegmentMatch SurfaceMatcher::classify(const Trackpoint &a,
                                      const Trackpoint &b) const {
  SegmentMatch m;
  m.length_m = GeoUtils::haversine(a.coord, b.coord);
  const TaggedWay *way =
      index_.nearestWay(GeoUtils::midpoint(a.coord, b.coord), P.tolerance_m);
  // ways carry an already canonicalised surface; Unknown stays Unknown
  m.surface = way ? way->surface : SurfaceType::Unknown;
  return m;
}

void SurfaceMatcher::matchRange(const std::vector<Trackpoint> &pts,
                                std::size_t begin, std::size_t end,
                                std::vector<SegmentMatch> &out) const {
  for (std::size_t i = begin; i < end; ++i)
    out[i] = classify(pts[i], pts[i + 1]);
}

std::vector<SegmentMatch>
SurfaceMatcher::match(const std::vector<Trackpoint> &pts) const {
  if (pts.size() < 2)
    return {};

  const std::size_t n = pts.size() - 1;
  std::vector<SegmentMatch> out(n);

  const std::size_t workers = std::clamp<std::size_t>(
      P.threads, 1,
      std::max<std::size_t>(1, std::min<std::size_t>(MaxMatcherThreads(), n / 64)));
  if (workers == 1) {
    matchRange(pts, 0, n, out);
    return out;
  }

  // contiguous chunks writing disjoint slots of `out`
  const std::size_t chunk = (n + workers - 1) / workers;
  std::vector<std::future<void>> jobs;
  jobs.reserve(workers);
  for (std::size_t begin = 0; begin < n; begin += chunk) {
    const std::size_t end = std::min(n, begin + chunk);
    jobs.push_back(std::async(std::launch::async, [&, begin, end] {
      matchRange(pts, begin, end, out);
    }));
  }
  for (auto &j : jobs)
    j.get();
  return out;
}
