// Raw OSM surface tag -> canonical SurfaceType table.

#include "models/SurfaceTypes.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace {

struct TagAlias {
  const char *tag;
  SurfaceType type;
};

// Sorted by tag so lookup can binary-search.
constexpr TagAlias kTagAliases[] = {
    {"acrylic", SurfaceType::Paved},
    {"artificial_turf", SurfaceType::Grass},
    {"asphalt", SurfaceType::Asphalt},
    {"bricks", SurfaceType::PavingStones},
    {"chipseal", SurfaceType::Asphalt},
    {"clay", SurfaceType::Clay},
    {"cobblestone", SurfaceType::Cobblestone},
    {"cobblestone:flattened", SurfaceType::Sett},
    {"compacted", SurfaceType::Compacted},
    {"concrete", SurfaceType::Concrete},
    {"concrete:lanes", SurfaceType::Concrete},
    {"concrete:plates", SurfaceType::Concrete},
    {"dirt", SurfaceType::Dirt},
    {"earth", SurfaceType::Earth},
    {"fine_gravel", SurfaceType::FineGravel},
    {"grass", SurfaceType::Grass},
    {"grass_paver", SurfaceType::Grass},
    {"gravel", SurfaceType::Gravel},
    {"ground", SurfaceType::Earth},
    {"ice", SurfaceType::Ice},
    {"metal", SurfaceType::Metal},
    {"metal_grid", SurfaceType::Metal},
    {"mud", SurfaceType::Mud},
    {"paved", SurfaceType::Paved},
    {"paving_stones", SurfaceType::PavingStones},
    {"pebblestone", SurfaceType::Gravel},
    {"rock", SurfaceType::Unpaved},
    {"sand", SurfaceType::Sand},
    {"sett", SurfaceType::Sett},
    {"snow", SurfaceType::Snow},
    {"unhewn_cobblestone", SurfaceType::Cobblestone},
    {"unpaved", SurfaceType::Unpaved},
    {"wood", SurfaceType::Wood},
    {"woodchips", SurfaceType::Unpaved},
};

std::string normalise(const std::string &raw) {
  // multi-valued tags ("gravel;grass") are classified by their first value
  std::string s = raw.substr(0, raw.find(';'));
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

} // namespace

SurfaceType SurfaceTypeFromTag(const std::string &raw) {
  const std::string key = normalise(raw);
  if (key.empty())
    return SurfaceType::Unknown;
  auto first = std::begin(kTagAliases);
  auto last = std::end(kTagAliases);
  auto it = std::lower_bound(first, last, key,
                             [](const TagAlias &a, const std::string &k) {
                               return std::strcmp(a.tag, k.c_str()) < 0;
                             });
  if (it != last && key == it->tag)
    return it->type;
  return SurfaceType::Unknown;
}

bool SurfaceTypeFromLabel(const std::string &label, SurfaceType &out) {
  for (std::size_t i = 0; i < kSurfaceTypeCount; ++i) {
    const auto t = static_cast<SurfaceType>(i);
    if (label == SurfaceTypeToString(t)) {
      out = t;
      return true;
    }
  }
  return false;
}
