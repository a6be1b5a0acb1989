#include "construction.h"
#include "geometry.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace tp {

std::vector<std::vector<Spot>> RoundRobinPartition::partition(const std::vector<Spot>& sorted,
                                                              int day_count) const {
  std::vector<std::vector<Spot>> buckets(day_count);
  for (size_t i = 0; i < sorted.size(); ++i)
    buckets[i % day_count].push_back(sorted[i]);
  return buckets;
}

std::vector<std::vector<Spot>> ChunkedPartition::partition(const std::vector<Spot>& sorted,
                                                           int day_count) const {
  std::vector<std::vector<Spot>> buckets(day_count);
  const size_t chunk = std::max<size_t>(1, sorted.size() / day_count);
  for (size_t i = 0; i < sorted.size(); ++i) {
    const size_t b = i / chunk;
    if (b >= buckets.size()) break; // remainder is truncated
    buckets[b].push_back(sorted[i]);
  }
  return buckets;
}

std::unique_ptr<PartitionStrategy> make_partition(const std::string& name) {
  if (name == "round_robin") return std::make_unique<RoundRobinPartition>();
  if (name == "chunked") return std::make_unique<ChunkedPartition>();
  throw std::invalid_argument("Unknown partition strategy '" + name + "' (round_robin|chunked)");
}

std::vector<Spot> sort_by_lon_lat(std::vector<Spot> spots) {
  std::stable_sort(spots.begin(), spots.end(), [](const Spot& a, const Spot& b) {
    if (a.lon != b.lon) return a.lon < b.lon;
    return a.lat < b.lat;
  });
  return spots;
}

std::vector<Spot> nearest_neighbor_route(const std::vector<Spot>& spots,
                                         std::optional<TransportMode> mode) {
  if (spots.empty()) return {};

  std::vector<Spot> unvisited(spots.begin() + 1, spots.end());
  std::vector<Spot> path;
  path.reserve(spots.size());
  path.push_back(spots.front());

  while (!unvisited.empty()) {
    const Spot& last = path.back();
    size_t best = 0;
    double best_cost = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < unvisited.size(); ++i) {
      const double c = leg_cost(last, unvisited[i], mode);
      if (c < best_cost) { best_cost = c; best = i; }
    }
    path.push_back(std::move(unvisited[best]));
    unvisited.erase(unvisited.begin() + best);
  }
  return path;
}

void resequence_day(DayPlan& day, std::optional<TransportMode> mode) {
  day.spots = nearest_neighbor_route(day.spots, mode);
}

Itinerary build_initial(const std::string& city,
                        const std::vector<Spot>& spots,
                        int day_count,
                        const PartitionStrategy& strategy,
                        std::optional<TransportMode> mode) {
  if (day_count <= 0)
    throw std::invalid_argument("day_count must be positive, got " + std::to_string(day_count));

  const auto sorted = sort_by_lon_lat(spots);
  auto buckets = strategy.partition(sorted, day_count);

  Itinerary it;
  it.city = city;
  it.days.reserve(day_count);
  for (int d = 0; d < day_count; ++d) {
    DayPlan dp;
    dp.day = d + 1;
    if (d < static_cast<int>(buckets.size()))
      dp.spots = nearest_neighbor_route(buckets[d], mode);
    it.days.push_back(std::move(dp));
  }
  return it;
}

Itinerary build_initial(const std::string& city,
                        const std::vector<Spot>& spots,
                        int day_count,
                        std::optional<TransportMode> mode) {
  return build_initial(city, spots, day_count, RoundRobinPartition{}, mode);
}

} // namespace tp
