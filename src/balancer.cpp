#include "balancer.h"
#include "semantics.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

namespace tp {

bool lacks_indoor(const DayPlan& day) {
  const bool any_out = std::any_of(day.spots.begin(), day.spots.end(), is_outdoor);
  const bool any_in = std::any_of(day.spots.begin(), day.spots.end(), is_indoor);
  return any_out && !any_in;
}

bool rebalance_day(Itinerary& it, int day_idx, bool verbose) {
  if (day_idx < 0 || day_idx >= static_cast<int>(it.days.size()))
    throw std::out_of_range("day index " + std::to_string(day_idx) + " outside itinerary of " +
                            std::to_string(it.days.size()) + " days");

  auto& day = it.days[day_idx];
  auto out_it = std::find_if(day.spots.begin(), day.spots.end(), is_outdoor);
  if (out_it == day.spots.end())
    return false; // nothing to fix

  for (size_t d = 0; d < it.days.size(); ++d) {
    if (static_cast<int>(d) == day_idx) continue;
    auto& donor = it.days[d];
    auto in_it = std::find_if(donor.spots.begin(), donor.spots.end(), is_indoor);
    if (in_it == donor.spots.end()) continue;

    Spot outdoor = *out_it;
    Spot indoor = *in_it;
    day.spots.erase(out_it);
    donor.spots.erase(in_it);
    day.spots.push_back(indoor);
    donor.spots.push_back(outdoor);

    if (verbose) {
      std::cout << "[balance] day=" << day.day << " took \"" << indoor.name
                << "\" from day=" << donor.day << " for \"" << outdoor.name << "\"\n";
    }
    return true;
  }
  return false;
}

int balance_itinerary(Itinerary& it, bool verbose) {
  int swaps = 0;
  for (size_t d = 0; d < it.days.size(); ++d) {
    if (!lacks_indoor(it.days[d])) continue;
    if (rebalance_day(it, static_cast<int>(d), verbose)) ++swaps;
    else if (verbose) std::cout << "[balance] day=" << it.days[d].day << " no indoor donor\n";
  }
  return swaps;
}

} // namespace tp
