// types.h
#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <optional>
#include <map>

namespace tp {

enum class TransportMode : std::uint8_t {
  WALK = 0,
  TRANSIT = 1,
  TAXI = 2,
};

struct Spot {
  std::string name;                     // non-empty
  double lat = 0.0;                     // [-90, 90]
  double lon = 0.0;                     // [-180, 180]
  std::string category;                 // outdoor / indoor / museum / temple / food ...
  std::optional<int> duration_minutes;  // > 0 when set
  std::optional<double> rating;         // 1.0 .. 5.0 when set
  std::string description;

  // Identity for the lifetime of a plan is name + coordinates.
  bool operator==(const Spot& o) const {
    return name == o.name && lat == o.lat && lon == o.lon;
  }
  bool operator!=(const Spot& o) const { return !(*this == o); }
};

struct DayPlan {
  int day = 1;              // 1-based, equals position in Itinerary::days + 1
  std::vector<Spot> spots;  // visiting order; this is the route

  // Derived on demand, never cached.
  double total_distance_km() const;
  double total_minutes(TransportMode mode) const;
};

struct Itinerary {
  std::string city;
  std::vector<DayPlan> days;

  std::size_t spot_count() const {
    std::size_t n = 0;
    for (const auto& d : days) n += d.spots.size();
    return n;
  }
};

struct ScoreConfig {
  double max_daily_km = 6.0;
  double exceed_km_penalty = 25.0;      // per km above max_daily_km
  double one_spot_day_penalty = 15.0;   // flat, per sparse day
  int min_spots_per_day = 2;

  // Mode-aware variant, used when the scorer is given a TransportMode.
  std::map<TransportMode, double> max_daily_minutes{
      {TransportMode::WALK, 240.0},
      {TransportMode::TRANSIT, 300.0},
      {TransportMode::TAXI, 360.0}};
  double exceed_minute_penalty = 1.5;   // per minute above the mode budget
};

// Hard ceilings for the checker/repairer, independent of the soft ScoreConfig.
struct HardLimits {
  double max_daily_km = 6.0;
  std::map<TransportMode, double> max_daily_minutes{
      {TransportMode::WALK, 240.0},
      {TransportMode::TRANSIT, 300.0},
      {TransportMode::TAXI, 360.0}};
};

} // namespace tp
