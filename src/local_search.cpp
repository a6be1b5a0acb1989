#include "local_search.h"
#include "construction.h"
#include "geometry.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>

namespace tp {

bool StrictImprovement::accept(double candidate, double /*current*/, double best, std::mt19937_64& /*rng*/) {
  return candidate < best;
}

Annealing::Annealing(double T0, double alpha, int reheats_every)
    : T0_(T0), alpha_(alpha), T_(T0), reheats_every_(reheats_every) {
  if (T0 <= 0.0 || alpha <= 0.0 || alpha > 1.0)
    throw std::invalid_argument("anneal needs T0 > 0 and 0 < alpha <= 1");
}

bool Annealing::accept(double candidate, double current, double /*best*/, std::mt19937_64& rng) {
  const double dE = candidate - current;
  if (dE <= 0.0) return true;
  std::uniform_real_distribution<double> U(0.0, 1.0);
  return U(rng) < std::exp(-dE / std::max(1e-6, T_));
}

void Annealing::on_trial_end(int trial) {
  T_ *= alpha_;
  if (reheats_every_ > 0 && trial % reheats_every_ == 0)
    T_ = T0_;
}

std::unique_ptr<AcceptancePolicy> make_acceptance(const SearchConfig& cfg) {
  if (cfg.acceptance == "strict") return std::make_unique<StrictImprovement>();
  if (cfg.acceptance == "anneal") return std::make_unique<Annealing>(cfg.T0, cfg.alpha, cfg.reheats_every);
  throw std::invalid_argument("Unknown acceptance policy '" + cfg.acceptance + "' (strict|anneal)");
}

static inline size_t pick_index(size_t n, std::mt19937_64& rng) {
  return std::uniform_int_distribution<size_t>(0, n - 1)(rng);
}

bool apply_move(Itinerary& it, std::mt19937_64& rng, std::optional<TransportMode> mode) {
  if (it.days.size() < 2) return false;

  std::vector<size_t> donors;
  for (size_t d = 0; d < it.days.size(); ++d)
    if (it.days[d].spots.size() >= 2) donors.push_back(d);
  if (donors.empty()) return false;

  const size_t from = donors[pick_index(donors.size(), rng)];
  auto& src = it.days[from].spots;
  const size_t k = pick_index(src.size(), rng);

  // any day except the donor
  size_t to = pick_index(it.days.size() - 1, rng);
  if (to >= from) ++to;

  Spot moved = std::move(src[k]);
  src.erase(src.begin() + k);
  it.days[to].spots.push_back(std::move(moved));

  resequence_day(it.days[from], mode);
  resequence_day(it.days[to], mode);
  return true;
}

bool apply_swap(Itinerary& it, std::mt19937_64& rng, std::optional<TransportMode> mode) {
  std::vector<size_t> filled;
  for (size_t d = 0; d < it.days.size(); ++d)
    if (!it.days[d].spots.empty()) filled.push_back(d);
  if (filled.size() < 2) return false;

  const size_t ia = pick_index(filled.size(), rng);
  size_t ib = pick_index(filled.size() - 1, rng);
  if (ib >= ia) ++ib;

  auto& a = it.days[filled[ia]].spots;
  auto& b = it.days[filled[ib]].spots;
  const size_t ka = pick_index(a.size(), rng);
  const size_t kb = pick_index(b.size(), rng);
  std::swap(a[ka], b[kb]);

  resequence_day(it.days[filled[ia]], mode);
  resequence_day(it.days[filled[ib]], mode);
  return true;
}

SearchResult optimize(const std::string& city,
                      const std::vector<Spot>& spots,
                      int day_count,
                      const ScoreConfig& score_cfg,
                      const SearchConfig& cfg,
                      std::optional<TransportMode> mode) {
  if (cfg.trials < 0)
    throw std::invalid_argument("trials must be >= 0, got " + std::to_string(cfg.trials));
  if (cfg.move_probability < 0.0 || cfg.move_probability > 1.0)
    throw std::invalid_argument("move_probability must lie in [0, 1]");

  std::mt19937_64 rng(cfg.seed);
  auto policy = make_acceptance(cfg);
  auto strategy = make_partition(cfg.partition);

  // --- seed ---
  Itinerary cur = build_initial(city, spots, day_count, *strategy, mode);
  ScoreResult cur_res = score_itinerary(cur, score_cfg, mode);

  SearchResult out;
  out.best = cur;
  out.best_score = cur_res.score;
  out.best_reasons = cur_res.reasons;
  double cur_score = cur_res.score;

  if (cfg.verbose) {
    std::map<size_t, int> hist;
    for (const auto& d : cur.days) hist[d.spots.size()]++;
    std::cout << "[init] city=" << city
              << " spots=" << spots.size()
              << " days=" << day_count
              << " partition=" << strategy->name()
              << " acceptance=" << policy->name()
              << " mode=" << (mode ? mode_name(*mode) : "distance")
              << " score=" << std::fixed << std::setprecision(2) << cur_score << "\n";
    std::cout << "day_size_histogram: ";
    for (const auto& kv : hist) std::cout << kv.first << "->" << kv.second << " ";
    std::cout << "\n";
  }

  std::uniform_real_distribution<double> U(0.0, 1.0);

  for (int t = 1; t <= cfg.trials; ++t) {
    out.stats.trials++;

    // full copy: a rejected mutation never touches cur
    Itinerary nxt = cur;
    const bool use_move = U(rng) < cfg.move_probability;
    const bool changed = use_move ? apply_move(nxt, rng, mode) : apply_swap(nxt, rng, mode);
    (use_move ? out.stats.move_ops : out.stats.swap_ops)++;

    if (!changed) {
      out.stats.noop_moves++;
      policy->on_trial_end(t);
      continue;
    }

    ScoreResult nxt_res = score_itinerary(nxt, score_cfg, mode);
    if (policy->accept(nxt_res.score, cur_score, out.best_score, rng)) {
      out.stats.accepted++;
      cur = std::move(nxt);
      cur_score = nxt_res.score;
      if (cur_score < out.best_score) {
        out.stats.improved++;
        out.best = cur;
        out.best_score = cur_score;
        out.best_reasons = std::move(nxt_res.reasons);
      }
    }

    if (cfg.verbose && (t % (cfg.log_every > 0 ? cfg.log_every : 50) == 0)) {
      std::cout << "[it " << t << "] "
                << " cur=" << std::fixed << std::setprecision(2) << cur_score
                << " best=" << out.best_score
                << " accepted=" << out.stats.accepted
                << " noop=" << out.stats.noop_moves << "\n";
    }
    policy->on_trial_end(t);
  }

  return out;
}

} // namespace tp
