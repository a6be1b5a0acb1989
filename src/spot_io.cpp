#include "spot_io.h"
#include "geometry.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;

namespace tp {

json load_json(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open file: " + path);
  json j;
  try { in >> j; }
  catch (const json::parse_error& e) {
    throw std::runtime_error("Corrupted JSON in " + path + ": " + e.what());
  }
  return j;
}

void save_json(const std::string& path, const json& j) {
  const fs::path p(path);
  if (p.has_parent_path()) fs::create_directories(p.parent_path());
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write file: " + path);
  out << std::setw(2) << j << "\n";
}

// ---------------- Spots ----------------

Spot spot_from_json(const json& j) {
  Spot s;
  s.name = j.at("name").get<std::string>();
  s.lat = j.at("lat").get<double>();
  s.lon = j.at("lon").get<double>();
  s.category = j.value("category", std::string{});
  if (j.contains("duration_minutes") && !j["duration_minutes"].is_null())
    s.duration_minutes = j["duration_minutes"].get<int>();
  if (j.contains("rating") && !j["rating"].is_null())
    s.rating = j["rating"].get<double>();
  s.description = j.value("description", std::string{});
  return s;
}

json spot_to_json(const Spot& s) {
  json j;
  j["name"] = s.name;
  j["lat"] = s.lat;
  j["lon"] = s.lon;
  j["category"] = s.category;
  if (s.duration_minutes) j["duration_minutes"] = *s.duration_minutes;
  if (s.rating) j["rating"] = *s.rating;
  if (!s.description.empty()) j["description"] = s.description;
  return j;
}

std::vector<Spot> spots_from_json(const json& arr) {
  if (!arr.is_array())
    throw std::runtime_error("spot data must be a JSON array.");
  std::vector<Spot> out;
  out.reserve(arr.size());
  for (size_t i = 0; i < arr.size(); ++i) {
    try { out.push_back(spot_from_json(arr[i])); }
    catch (const json::exception& e) {
      throw std::runtime_error("Spot " + std::to_string(i) + ": " + e.what());
    }
  }
  return out;
}

std::vector<Spot> load_spots(const std::string& path) {
  return spots_from_json(load_json(path));
}

int default_duration_minutes(const std::string& category) {
  static const std::unordered_map<std::string, int> k{
      {"outdoor", 60}, {"indoor", 90}, {"temple", 45},
      {"shopping", 60}, {"museum", 90}, {"food", 60}};
  auto it = k.find(category);
  return it == k.end() ? 60 : it->second;
}

double default_rating(const std::string& category) {
  static const std::unordered_map<std::string, double> k{
      {"outdoor", 4.2}, {"indoor", 4.3}, {"temple", 4.1},
      {"shopping", 3.9}, {"museum", 4.5}, {"food", 4.0}};
  auto it = k.find(category);
  return it == k.end() ? 4.0 : it->second;
}

int apply_spot_defaults(std::vector<Spot>& spots) {
  int changed = 0;
  for (auto& s : spots) {
    bool c = false;
    if (!s.duration_minutes) { s.duration_minutes = default_duration_minutes(s.category); c = true; }
    if (!s.rating) { s.rating = default_rating(s.category); c = true; }
    if (c) ++changed;
  }
  return changed;
}

// ---------------- Itineraries ----------------

static double round2(double v) { return std::round(v * 100.0) / 100.0; }

json itinerary_to_json(const Itinerary& it, std::optional<TransportMode> mode) {
  json j;
  j["city"] = it.city;
  if (mode) j["mode"] = mode_name(*mode);
  j["days"] = json::array();
  for (const auto& d : it.days) {
    json dj;
    dj["day"] = d.day;
    dj["total_distance_km"] = round2(d.total_distance_km());
    if (mode) dj["total_minutes"] = round2(d.total_minutes(*mode));
    dj["spots"] = json::array();
    for (const auto& s : d.spots) dj["spots"].push_back(spot_to_json(s));
    j["days"].push_back(std::move(dj));
  }
  return j;
}

Itinerary itinerary_from_json(const json& j) {
  Itinerary it;
  it.city = j.at("city").get<std::string>();
  const auto& days = j.at("days");
  if (!days.is_array()) throw std::runtime_error("itinerary 'days' must be an array.");
  int expect = 1;
  for (const auto& dj : days) {
    DayPlan d;
    d.day = dj.value("day", expect);
    if (d.day != expect)
      throw std::runtime_error("itinerary days must be numbered 1..N in order; got day " +
                               std::to_string(d.day) + " at position " + std::to_string(expect));
    if (dj.contains("spots")) d.spots = spots_from_json(dj["spots"]);
    it.days.push_back(std::move(d));
    ++expect;
  }
  return it;
}

json violations_to_json(const std::vector<Violation>& v) {
  json arr = json::array();
  for (const auto& x : v)
    arr.push_back({{"day", x.day}, {"measured", round2(x.measured)}, {"limit", x.limit}});
  return arr;
}

json repair_report_to_json(const RepairReport& r) {
  json j;
  j["violations"] = violations_to_json(r.violations);
  j["moved"] = json::array();
  for (const auto& m : r.moved)
    j["moved"].push_back({{"spot", m.spot.name}, {"from_day", m.from_day}, {"to_day", m.to_day}});
  j["dropped"] = json::array();
  for (const auto& s : r.dropped) j["dropped"].push_back(spot_to_json(s));
  j["skipped_days"] = r.skipped_days;
  return j;
}

} // namespace tp
