// penalties.h
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "types.h"

namespace tp {

struct ScoreBreakdown {
  double route = 0.0;    // raw km (or minutes) over all days
  double exceed = 0.0;   // budget overrun penalties
  double sparse = 0.0;   // too-few-spots penalties
  double total() const { return route + exceed + sparse; }
};

struct ScoreResult {
  double score = 0.0;                // lower is better
  std::vector<std::string> reasons;  // one line per penalty, in day order
  ScoreBreakdown breakdown;
};

// True when the itinerary holds enough spots for every day to reach
// min_spots_per_day, which is when sparse days get penalized.
bool expects_min_spots(const Itinerary& it, const ScoreConfig& cfg);

// Soft-constraint cost. Measures kilometres, or minutes of travel when a mode
// is given. Pure: the itinerary is not touched.
ScoreResult score_itinerary(const Itinerary& it,
                            const ScoreConfig& cfg,
                            std::optional<TransportMode> mode = std::nullopt);

} // namespace tp
