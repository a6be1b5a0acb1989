// construction.h
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "types.h"

namespace tp {

// Splits a (longitude, latitude)-sorted spot list into exactly day_count buckets.
class PartitionStrategy {
public:
  virtual ~PartitionStrategy() = default;
  virtual std::vector<std::vector<Spot>> partition(const std::vector<Spot>& sorted,
                                                   int day_count) const = 0;
  virtual const char* name() const = 0;
};

// Spot i goes to day i mod day_count. Lossless, sizes differ by at most one.
class RoundRobinPartition : public PartitionStrategy {
public:
  std::vector<std::vector<Spot>> partition(const std::vector<Spot>& sorted,
                                           int day_count) const override;
  const char* name() const override { return "round_robin"; }
};

// Contiguous blocks of max(1, n / day_count) spots. Blocks past day_count are
// dropped, so a remainder that does not divide evenly is lost.
class ChunkedPartition : public PartitionStrategy {
public:
  std::vector<std::vector<Spot>> partition(const std::vector<Spot>& sorted,
                                           int day_count) const override;
  const char* name() const override { return "chunked"; }
};

// "round_robin" | "chunked". Throws std::invalid_argument.
std::unique_ptr<PartitionStrategy> make_partition(const std::string& name);

// Spatial locality proxy: by longitude, then latitude. Stable.
std::vector<Spot> sort_by_lon_lat(std::vector<Spot> spots);

// Greedy chaining from spots[0]; ties go to the earliest remaining spot.
std::vector<Spot> nearest_neighbor_route(const std::vector<Spot>& spots,
                                         std::optional<TransportMode> mode = std::nullopt);

// Re-chain one day in place (route repair after spots were moved in or out).
void resequence_day(DayPlan& day, std::optional<TransportMode> mode = std::nullopt);

// Seed itinerary. Throws std::invalid_argument if day_count <= 0.
Itinerary build_initial(const std::string& city,
                        const std::vector<Spot>& spots,
                        int day_count,
                        const PartitionStrategy& strategy,
                        std::optional<TransportMode> mode = std::nullopt);

// Round-robin default.
Itinerary build_initial(const std::string& city,
                        const std::vector<Spot>& spots,
                        int day_count,
                        std::optional<TransportMode> mode = std::nullopt);

} // namespace tp
