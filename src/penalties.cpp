// penalties.cpp
#include "penalties.h"
#include "geometry.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tp {

bool expects_min_spots(const Itinerary& it, const ScoreConfig& cfg) {
  const long long days = static_cast<long long>(it.days.size());
  return static_cast<long long>(it.spot_count()) >= days * cfg.min_spots_per_day;
}

static double minute_budget(const ScoreConfig& cfg, TransportMode mode) {
  auto itb = cfg.max_daily_minutes.find(mode);
  if (itb == cfg.max_daily_minutes.end())
    throw std::invalid_argument(std::string("ScoreConfig has no minute budget for mode ") + mode_name(mode));
  return itb->second;
}

ScoreResult score_itinerary(const Itinerary& it,
                            const ScoreConfig& cfg,
                            std::optional<TransportMode> mode) {
  ScoreResult res;
  const bool expect_min = expects_min_spots(it, cfg);

  const double budget = mode ? minute_budget(cfg, *mode) : cfg.max_daily_km;
  const double weight = mode ? cfg.exceed_minute_penalty : cfg.exceed_km_penalty;

  for (const auto& day : it.days) {
    const double measured = mode ? day.total_minutes(*mode) : day.total_distance_km();

    // prefer shorter days
    res.breakdown.route += measured;

    if (measured > budget) {
      const double exceed = measured - budget;
      const double penalty = exceed * weight;
      res.breakdown.exceed += penalty;

      std::ostringstream r;
      r << std::fixed;
      if (mode) {
        r << "Day " << day.day << ": exceeded " << std::setprecision(0) << budget
          << " min (" << mode_name(*mode) << ") by " << std::setprecision(1) << exceed
          << " min (+" << std::setprecision(2) << penalty << ")";
      } else {
        r << "Day " << day.day << ": exceeded " << std::setprecision(1) << budget
          << "km by " << std::setprecision(2) << exceed << "km (+" << penalty << ")";
      }
      res.reasons.push_back(r.str());
    }

    if (expect_min && static_cast<int>(day.spots.size()) < cfg.min_spots_per_day) {
      res.breakdown.sparse += cfg.one_spot_day_penalty;
      std::ostringstream r;
      r << "Day " << day.day << ": only " << day.spots.size() << " spot(s) (+"
        << std::fixed << std::setprecision(2) << cfg.one_spot_day_penalty << ")";
      res.reasons.push_back(r.str());
    }
  }

  res.score = res.breakdown.total();
  return res;
}

} // namespace tp
