// route_solver.h
#pragma once
#include <optional>
#include <vector>
#include "types.h"

namespace tp {

struct RouteSolveParams {
  int time_limit_seconds = 1;
  bool log_search = false;   // OR-Tools search log
  bool verbose = false;
};

// Open-path TSP over one day's spots with spots[0] fixed as the start.
// Arc cost is metres, or seconds of travel when a mode is given.
// Returns the input order if the solver finds no assignment.
std::vector<Spot> solve_day_route(const std::vector<Spot>& spots,
                                  const RouteSolveParams& params,
                                  std::optional<TransportMode> mode = std::nullopt);

// Re-solve every day with >= 3 spots, keeping a new route only if it is
// strictly shorter. Returns the number of days that changed.
int polish_routes(Itinerary& it,
                  const RouteSolveParams& params,
                  std::optional<TransportMode> mode = std::nullopt);

} // namespace tp
