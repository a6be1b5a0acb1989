// local_search.h
#pragma once
#include "types.h"
#include "penalties.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace tp {

struct SearchConfig {
  int trials = 200;
  std::uint64_t seed = 42;       // fixed: identical input gives identical output
  double move_probability = 0.6; // otherwise swap
  std::string partition = "round_robin";

  std::string acceptance = "strict"; // strict | anneal
  double T0 = 5.0, alpha = 0.995;    // anneal only
  int reheats_every = 3000;          // anneal only

  bool verbose = false;
  int log_every = 50;                // print every N trials when verbose
};

struct SearchStats {
  int trials = 0;
  int move_ops = 0;
  int swap_ops = 0;
  int noop_moves = 0;   // operator found no eligible day
  int accepted = 0;
  int improved = 0;     // new best found
};

struct SearchResult {
  Itinerary best;
  double best_score = 0.0;
  std::vector<std::string> best_reasons;
  SearchStats stats;
};

// Decides whether a scored candidate replaces the current itinerary.
class AcceptancePolicy {
public:
  virtual ~AcceptancePolicy() = default;
  virtual bool accept(double candidate, double current, double best, std::mt19937_64& rng) = 0;
  virtual void on_trial_end(int /*trial*/) {}
  virtual const char* name() const = 0;
};

// Pure hill-climbing: candidate must beat the best score. Draws no randomness.
class StrictImprovement : public AcceptancePolicy {
public:
  bool accept(double candidate, double current, double best, std::mt19937_64& rng) override;
  const char* name() const override { return "strict"; }
};

// Metropolis rule against the current score, geometric cooling with reheats.
class Annealing : public AcceptancePolicy {
public:
  Annealing(double T0, double alpha, int reheats_every);
  bool accept(double candidate, double current, double best, std::mt19937_64& rng) override;
  void on_trial_end(int trial) override;
  const char* name() const override { return "anneal"; }
  double temperature() const { return T_; }

private:
  double T0_, alpha_, T_;
  int reheats_every_;
};

// "strict" | "anneal". Throws std::invalid_argument.
std::unique_ptr<AcceptancePolicy> make_acceptance(const SearchConfig& cfg);

// Move: random day with >= 2 spots gives a random spot to a random other day.
// Swap: two distinct non-empty days exchange one random spot each.
// Both re-chain the two affected days and return false (itinerary untouched)
// when no eligible day exists.
bool apply_move(Itinerary& it, std::mt19937_64& rng, std::optional<TransportMode> mode);
bool apply_swap(Itinerary& it, std::mt19937_64& rng, std::optional<TransportMode> mode);

// Construct, then hill-climb for cfg.trials mutations.
// Throws std::invalid_argument for day_count <= 0 or trials < 0.
SearchResult optimize(const std::string& city,
                      const std::vector<Spot>& spots,
                      int day_count,
                      const ScoreConfig& score_cfg,
                      const SearchConfig& cfg,
                      std::optional<TransportMode> mode = std::nullopt);

} // namespace tp
