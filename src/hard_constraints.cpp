#include "hard_constraints.h"
#include "geometry.h"

#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace tp {

std::vector<Violation> check_daily_distance(const Itinerary& it, const HardLimits& limits) {
  std::vector<Violation> out;
  for (const auto& day : it.days) {
    const double km = day.total_distance_km();
    if (km > limits.max_daily_km)
      out.push_back({day.day, km, limits.max_daily_km});
  }
  return out;
}

std::vector<Violation> check_daily_time(const Itinerary& it, TransportMode mode, const HardLimits& limits) {
  auto itl = limits.max_daily_minutes.find(mode);
  if (itl == limits.max_daily_minutes.end())
    throw std::invalid_argument(std::string("HardLimits has no minute cap for mode ") + mode_name(mode));

  std::vector<Violation> out;
  for (const auto& day : it.days) {
    const double minutes = day.total_minutes(mode);
    if (minutes > itl->second)
      out.push_back({day.day, minutes, itl->second});
  }
  return out;
}

std::vector<Violation> check_hard_constraints(const Itinerary& it,
                                              const HardLimits& limits,
                                              std::optional<TransportMode> mode) {
  return mode ? check_daily_time(it, *mode, limits) : check_daily_distance(it, limits);
}

RepairReport repair_itinerary(Itinerary& it,
                              const HardLimits& limits,
                              std::optional<TransportMode> mode,
                              bool verbose) {
  RepairReport rep;
  rep.violations = check_hard_constraints(it, limits, mode);

  for (const auto& v : rep.violations) {
    const int day_idx = v.day - 1;
    if (day_idx < 0 || day_idx >= static_cast<int>(it.days.size()))
      throw std::out_of_range("violation refers to missing day " + std::to_string(v.day));
    auto& src = it.days[day_idx];

    // a single-spot day cannot be split any further
    if (src.spots.size() <= 1) {
      rep.skipped_days.push_back(v.day);
      continue;
    }

    Spot moved = src.spots.back();
    src.spots.pop_back();

    DayPlan* target = nullptr;
    double min_dist = std::numeric_limits<double>::infinity();
    for (auto& other : it.days) {
      if (other.day == src.day) continue;
      if (other.spots.empty()) continue;
      const double d = distance(moved, other.spots.back());
      if (d < min_dist) { min_dist = d; target = &other; }
    }

    if (target) {
      if (verbose) {
        std::cout << "[repair] day=" << src.day << " -> day=" << target->day
                  << " spot=\"" << moved.name << "\""
                  << " gap=" << std::fixed << std::setprecision(2) << min_dist << "km\n";
      }
      rep.moved.push_back({moved, src.day, target->day});
      target->spots.push_back(std::move(moved));
    } else {
      if (verbose)
        std::cout << "[repair] day=" << src.day << " no destination day, dropped \"" << moved.name << "\"\n";
      rep.dropped.push_back(std::move(moved));
    }
  }
  return rep;
}

} // namespace tp
