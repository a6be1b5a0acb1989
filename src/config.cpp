#include "config.h"
#include "geometry.h"

#include <stdexcept>

namespace tp {

void read_minute_caps(const nlohmann::json& j, std::map<TransportMode, double>& caps) {
  if (!j.is_object())
    throw std::invalid_argument("minute caps must be an object keyed by walk/transit/taxi");
  for (auto it = j.begin(); it != j.end(); ++it)
    caps[parse_mode(it.key())] = it.value().get<double>();
}

PlannerConfig parse_config(const nlohmann::json& j) {
  PlannerConfig c;

  c.days = j.value("DAYS", c.days);
  if (j.contains("MODE") && !j["MODE"].is_null())
    c.mode = parse_mode(j["MODE"].get<std::string>());

  // soft scoring
  c.score.max_daily_km         = j.value("MAX_DAILY_KM", c.score.max_daily_km);
  c.score.exceed_km_penalty    = j.value("EXCEED_KM_PENALTY", c.score.exceed_km_penalty);
  c.score.exceed_minute_penalty = j.value("EXCEED_MINUTE_PENALTY", c.score.exceed_minute_penalty);
  c.score.one_spot_day_penalty = j.value("ONE_SPOT_DAY_PENALTY", c.score.one_spot_day_penalty);
  c.score.min_spots_per_day    = j.value("MIN_SPOTS_PER_DAY", c.score.min_spots_per_day);
  if (j.contains("MAX_DAILY_MINUTES"))
    read_minute_caps(j["MAX_DAILY_MINUTES"], c.score.max_daily_minutes);

  // hard caps
  c.hard.max_daily_km = j.value("HARD_MAX_DAILY_KM", c.hard.max_daily_km);
  if (j.contains("HARD_MAX_DAILY_MINUTES"))
    read_minute_caps(j["HARD_MAX_DAILY_MINUTES"], c.hard.max_daily_minutes);

  // search
  c.search.trials           = j.value("TRIALS", c.search.trials);
  c.search.seed             = j.value("RNG_SEED", c.search.seed);
  c.search.move_probability = j.value("MOVE_PROBABILITY", c.search.move_probability);
  c.search.partition        = j.value("PARTITION", c.search.partition);
  c.search.acceptance       = j.value("ACCEPTANCE", c.search.acceptance);
  c.search.T0               = j.value("T0", c.search.T0);
  c.search.alpha            = j.value("ALPHA", c.search.alpha);
  c.search.reheats_every    = j.value("REHEATS_EVERY", c.search.reheats_every);
  c.search.log_every        = j.value("LOG_EVERY", c.search.log_every);

  // post-processing
  c.repair         = j.value("REPAIR", c.repair);
  c.balance        = j.value("BALANCE", c.balance);
  c.polish_seconds = j.value("ROUTE_POLISH_SECONDS", c.polish_seconds);
  c.result_out     = j.value("RESULT_OUT", c.result_out);

  if (c.days <= 0) throw std::invalid_argument("DAYS must be positive");
  if (c.search.trials < 0) throw std::invalid_argument("TRIALS must be >= 0");
  if (c.score.min_spots_per_day < 0) throw std::invalid_argument("MIN_SPOTS_PER_DAY must be >= 0");
  if (c.search.move_probability < 0.0 || c.search.move_probability > 1.0)
    throw std::invalid_argument("MOVE_PROBABILITY must lie in [0, 1]");
  return c;
}

} // namespace tp
