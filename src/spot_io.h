// spot_io.h
#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "types.h"
#include "hard_constraints.h"

namespace tp {

using json = nlohmann::json;

json load_json(const std::string& path);
void save_json(const std::string& path, const json& j);

// ---- Spots ----
Spot spot_from_json(const json& j);
json spot_to_json(const Spot& s);
std::vector<Spot> spots_from_json(const json& arr);
std::vector<Spot> load_spots(const std::string& path);

// Missing duration/rating filled from per-category defaults.
// Returns the number of spots that changed.
int apply_spot_defaults(std::vector<Spot>& spots);
int default_duration_minutes(const std::string& category);
double default_rating(const std::string& category);

// ---- Itineraries ----
json itinerary_to_json(const Itinerary& it, std::optional<TransportMode> mode = std::nullopt);
Itinerary itinerary_from_json(const json& j);

json violations_to_json(const std::vector<Violation>& v);
json repair_report_to_json(const RepairReport& r);

} // namespace tp
