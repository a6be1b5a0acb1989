// geometry.h
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "types.h"

namespace tp {

constexpr double KM_PER_DEGREE = 111.0;

struct ModeProfile {
  double speed_kmh;         // average door-to-door speed
  double overhead_minutes;  // fixed cost per leg (waiting, boarding)
};

ModeProfile mode_profile(TransportMode mode);

const char* mode_name(TransportMode mode);

// "walk" / "transit" / "taxi" (case-insensitive). Throws std::invalid_argument.
TransportMode parse_mode(const std::string& s);

// Flat-earth approximation, valid for intra-city spans.
double distance(const Spot& a, const Spot& b);

// Minutes to travel from a to b with the given mode, overhead included.
double travel_cost(const Spot& a, const Spot& b, TransportMode mode);

// Ordering key for route construction: travel_cost when a mode is known,
// otherwise plain distance.
inline double leg_cost(const Spot& a, const Spot& b, std::optional<TransportMode> mode) {
  return mode ? travel_cost(a, b, *mode) : distance(a, b);
}

// Sum over consecutive stops.
double route_distance_km(const std::vector<Spot>& route);
double route_minutes(const std::vector<Spot>& route, TransportMode mode);

} // namespace tp
