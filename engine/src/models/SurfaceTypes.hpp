#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

// Canonical surface vocabulary. Raw OSM `surface=*` values are folded into
// this set; anything unrecognised becomes Unknown.
enum class SurfaceType : uint8_t {
  Asphalt = 0,
  Concrete,
  PavingStones,
  Sett,
  Cobblestone,
  Metal,
  Wood,
  Paved,
  Compacted,
  Gravel,
  FineGravel,
  Dirt,
  Earth,
  Grass,
  Sand,
  Mud,
  Clay,
  Snow,
  Ice,
  Unpaved,
  Unknown,
  Count
};

constexpr std::size_t kSurfaceTypeCount =
    static_cast<std::size_t>(SurfaceType::Count);

inline const char *SurfaceTypeToString(SurfaceType type) {
  switch (type) {
  case SurfaceType::Asphalt:
    return "asphalt";
  case SurfaceType::Concrete:
    return "concrete";
  case SurfaceType::PavingStones:
    return "paving_stones";
  case SurfaceType::Sett:
    return "sett";
  case SurfaceType::Cobblestone:
    return "cobblestone";
  case SurfaceType::Metal:
    return "metal";
  case SurfaceType::Wood:
    return "wood";
  case SurfaceType::Paved:
    return "paved";
  case SurfaceType::Compacted:
    return "compacted";
  case SurfaceType::Gravel:
    return "gravel";
  case SurfaceType::FineGravel:
    return "fine_gravel";
  case SurfaceType::Dirt:
    return "dirt";
  case SurfaceType::Earth:
    return "earth";
  case SurfaceType::Grass:
    return "grass";
  case SurfaceType::Sand:
    return "sand";
  case SurfaceType::Mud:
    return "mud";
  case SurfaceType::Clay:
    return "clay";
  case SurfaceType::Snow:
    return "snow";
  case SurfaceType::Ice:
    return "ice";
  case SurfaceType::Unpaved:
    return "unpaved";
  default:
    return "unknown";
  }
}

// Canonicalise a raw tag value ("Asphalt", "concrete:plates",
// "gravel;grass", "ground", ...). Pure table lookup, never throws.
SurfaceType SurfaceTypeFromTag(const std::string &raw);

// Exact inverse of SurfaceTypeToString; returns false for anything else.
bool SurfaceTypeFromLabel(const std::string &label, SurfaceType &out);
