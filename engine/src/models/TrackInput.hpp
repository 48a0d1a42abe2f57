#pragma once

#include "models/CoreTypes.hpp"
#include <nlohmann/json.hpp>

// Track bodies accepted by the HTTP layer:
//   {"points":[{"lat":..,"lon":..,"ele":..}, ...]}
//   GeoJSON Feature / LineString / MultiLineString with [lon, lat(, ele)]
// Elevation may be spelled ele / elv / elevation, a number or a numeric
// string, or missing. Throws InputError.
Track parse_track(const nlohmann::json &body);

// Range / finiteness checks shared by every entry point. Throws InputError.
void validate_track(const Track &track);
