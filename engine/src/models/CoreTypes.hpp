#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "models/SurfaceTypes.hpp"

// Basic geographic position in degrees.
struct Coordinate {
  double lat = 0.0;
  double lon = 0.0;
};

// A single recorded position along a route. Elevation is optional because GPS
// loggers routinely drop it for individual fixes.
struct Trackpoint {
  Coordinate coord;
  std::optional<double> ele; // metres
  std::size_t index = 0;     // position in the source container
};

// Axis-aligned lat/lon rectangle.
struct BBox {
  double min_lat, min_lon, max_lat, max_lon;
};

// Linear geometry from the geodata source annotated with its surface.
struct TaggedWay {
  int64_t way_id = 0;               // OSM way identifier, 0 if not known
  std::vector<Coordinate> geometry; // ordered vertices
  SurfaceType surface = SurfaceType::Unknown;
};

// Convenience container for a full parsed track.
struct Track {
  std::vector<Trackpoint> points;
};
