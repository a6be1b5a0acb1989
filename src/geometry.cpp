#include "geometry.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace tp {

ModeProfile mode_profile(TransportMode mode) {
  switch (mode) {
    case TransportMode::WALK:    return {4.5, 0.0};
    case TransportMode::TRANSIT: return {25.0, 5.0};
    case TransportMode::TAXI:    return {30.0, 0.0};
  }
  throw std::invalid_argument("unknown transport mode");
}

const char* mode_name(TransportMode mode) {
  switch (mode) {
    case TransportMode::WALK:    return "walk";
    case TransportMode::TRANSIT: return "transit";
    case TransportMode::TAXI:    return "taxi";
  }
  return "unknown";
}

TransportMode parse_mode(const std::string& s) {
  std::string k = s;
  std::transform(k.begin(), k.end(), k.begin(), [](unsigned char c) { return std::tolower(c); });
  if (k == "walk") return TransportMode::WALK;
  if (k == "transit") return TransportMode::TRANSIT;
  if (k == "taxi") return TransportMode::TAXI;
  throw std::invalid_argument("Invalid transport mode '" + s + "'. Must be one of: walk, transit, taxi");
}

double distance(const Spot& a, const Spot& b) {
  const double dlat = a.lat - b.lat;
  const double dlon = a.lon - b.lon;
  return std::sqrt(dlat * dlat + dlon * dlon) * KM_PER_DEGREE;
}

double travel_cost(const Spot& a, const Spot& b, TransportMode mode) {
  const ModeProfile p = mode_profile(mode);
  return distance(a, b) / p.speed_kmh * 60.0 + p.overhead_minutes;
}

double route_distance_km(const std::vector<Spot>& route) {
  double total = 0.0;
  for (size_t i = 0; i + 1 < route.size(); ++i)
    total += distance(route[i], route[i + 1]);
  return total;
}

double route_minutes(const std::vector<Spot>& route, TransportMode mode) {
  double total = 0.0;
  for (size_t i = 0; i + 1 < route.size(); ++i)
    total += travel_cost(route[i], route[i + 1], mode);
  return total;
}

double DayPlan::total_distance_km() const { return route_distance_km(spots); }

double DayPlan::total_minutes(TransportMode mode) const { return route_minutes(spots, mode); }

} // namespace tp
