#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

// Anything able to hand back surface-tagged ways for a bounding box. The
// production implementation talks to Overpass; tests plug in fixed data.
class GeodataSource {
public:
  virtual ~GeodataSource() = default;

  // Throws GeodataError on transport failure, timeout or a bad response.
  virtual std::vector<TaggedWay> fetch_ways(const BBox &bbox) = 0;
};
