#pragma once

#include "models/CoreTypes.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using Json = nlohmann::json;

// Subset of the Overpass `[out:json]` / `out geom;` response we care about.

struct OverpassElement {
  std::string type; // "way" for everything our query asks for
  int64_t id = 0;
  std::vector<Coordinate> geometry;
  std::string surface; // tags.surface, empty if absent
};

struct OverpassResponse {
  std::vector<OverpassElement> elements;
};

// --- OverpassElement ----
inline void from_json(const Json &j, OverpassElement &e) {
  e.type = j.value("type", "");
  e.id = j.value("id", int64_t{0});
  e.geometry.clear();
  if (j.contains("geometry") && j["geometry"].is_array()) {
    for (const auto &v : j["geometry"]) {
      // clipped geometries contain nulls for vertices outside the bbox
      if (!v.is_object() || !v.contains("lat") || !v.contains("lon"))
        continue;
      e.geometry.push_back({v["lat"].get<double>(), v["lon"].get<double>()});
    }
  }
  e.surface.clear();
  if (j.contains("tags") && j["tags"].is_object()) {
    const auto &tags = j["tags"];
    if (tags.contains("surface") && tags["surface"].is_string())
      e.surface = tags["surface"].get<std::string>();
  }
}

// --- OverpassResponse ----
inline void from_json(const Json &j, OverpassResponse &r) {
  if (!j.is_object() || !j.contains("elements") || !j["elements"].is_array())
    throw std::runtime_error("No elements in Overpass response");
  r.elements.clear();
  for (const auto &el : j["elements"])
    r.elements.push_back(el.get<OverpassElement>());
}

// Elements usable for matching, canonicalised, in response order.
inline std::vector<TaggedWay> to_tagged_ways(const OverpassResponse &r) {
  std::vector<TaggedWay> ways;
  ways.reserve(r.elements.size());
  for (const auto &e : r.elements) {
    if (e.geometry.size() < 2)
      continue;
    TaggedWay w;
    w.way_id = e.id;
    w.geometry = e.geometry;
    w.surface = SurfaceTypeFromTag(e.surface);
    ways.push_back(std::move(w));
  }
  return ways;
}
