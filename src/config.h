// config.h
#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "types.h"
#include "local_search.h"

namespace tp {

struct PlannerConfig {
  int days = 3;
  std::optional<TransportMode> mode;  // none = distance-based costing

  ScoreConfig score;
  HardLimits hard;
  SearchConfig search;

  bool repair = false;
  bool balance = false;
  int polish_seconds = 0;             // 0 = skip OR-Tools route polish
  std::string result_out = "itinerary.json";
};

// Every key is optional; missing keys keep the defaults above.
// Throws std::invalid_argument for out-of-range values.
PlannerConfig parse_config(const nlohmann::json& j);

// {"walk": 240, "transit": 300, "taxi": 360}; unlisted modes keep their value.
void read_minute_caps(const nlohmann::json& j, std::map<TransportMode, double>& caps);

} // namespace tp
