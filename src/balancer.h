// balancer.h
#pragma once
#include "types.h"

namespace tp {

// Day has at least one outdoor spot and no indoor spot.
bool lacks_indoor(const DayPlan& day);

// Single best-effort swap for days[day_idx] (0-based). If the day holds an
// outdoor spot, the first other day (in day order) holding an indoor spot
// trades its first indoor spot for this day's first outdoor spot; both are
// appended to their new day. Returns false, without touching the
// itinerary, when the day has no outdoor spot or no donor exists.
// Throws std::out_of_range for a bad index.
bool rebalance_day(Itinerary& it, int day_idx, bool verbose = false);

// rebalance_day for every day that lacks_indoor, in day order.
// Returns the number of successful swaps.
int balance_itinerary(Itinerary& it, bool verbose = false);

} // namespace tp
