// hard_constraints.h
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "types.h"

namespace tp {

struct Violation {
  int day = 0;            // 1-based
  double measured = 0.0;  // km, or minutes when checked per mode
  double limit = 0.0;
};

// Days whose route length exceeds limits.max_daily_km.
std::vector<Violation> check_daily_distance(const Itinerary& it, const HardLimits& limits);

// Days whose travel time for the mode exceeds limits.max_daily_minutes[mode].
std::vector<Violation> check_daily_time(const Itinerary& it, TransportMode mode, const HardLimits& limits);

// Distance check without a mode, time check with one.
std::vector<Violation> check_hard_constraints(const Itinerary& it,
                                              const HardLimits& limits,
                                              std::optional<TransportMode> mode = std::nullopt);

struct Relocation {
  Spot spot;
  int from_day = 0;
  int to_day = 0;
};

struct RepairReport {
  std::vector<Violation> violations;   // what the pass started from
  std::vector<Relocation> moved;
  std::vector<Spot> dropped;           // no other day could take these
  std::vector<int> skipped_days;       // violating days with a single spot
  bool lost_spots() const { return !dropped.empty(); }
};

// One pass: every violating day with more than one spot gives up its last
// spot to the other non-empty day whose last spot is nearest (first in day
// order on ties). The destination route is not reordered. With no candidate
// day the spot is dropped and reported. Re-run the check afterwards; a single
// pass is not guaranteed to clear everything.
RepairReport repair_itinerary(Itinerary& it,
                              const HardLimits& limits,
                              std::optional<TransportMode> mode = std::nullopt,
                              bool verbose = false);

} // namespace tp
