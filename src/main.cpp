// main.cpp
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "utils.h"
#include "types.h"
#include "config.h"
#include "geometry.h"
#include "spot_io.h"
#include "validation.h"
#include "local_search.h"
#include "construction.h"
#include "penalties.h"
#include "hard_constraints.h"
#include "balancer.h"
#include "route_solver.h"

using json = nlohmann::json;
using namespace tp;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string spots_path;         // required
  std::string city;               // required
  std::string config_path = "";   // optional
  std::string itinerary_path = ""; // optional: post-process an existing plan
  std::string out_path = "";

  // overrides on top of the config file
  std::optional<int> days;
  std::optional<std::string> mode;
  std::optional<int> trials;
  std::optional<long long> seed;
  std::optional<std::string> partition;
  std::optional<std::string> acceptance;
  std::optional<int> polish_seconds;
  bool repair = false;
  bool balance = false;
  bool verbose = true;            // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  tripplan --spots spots.json --city NAME [options]

Required:
  --spots PATH          JSON array of spots
  --city NAME

Optional:
  --config PATH         JSON config (uppercase keys, all optional)
  --itinerary PATH      Skip planning; repair/balance/polish this itinerary
  --days N
  --mode walk|transit|taxi
  --trials N
  --seed N
  --partition round_robin|chunked
  --acceptance strict|anneal
  --repair              Relocate spots off days over the hard cap
  --balance             Swap indoor spots into all-outdoor days
  --polish SECONDS      Re-solve each day's route with OR-Tools
  --out PATH            Result JSON (default from config RESULT_OUT)
  --quiet               Less logging
  --help
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    auto need_int = [&](const char* name) {
      const std::string v = need(name);
      try { return std::stoll(v); }
      catch (const std::exception&) { std::cerr << "Expected an integer for " << name << ", got '" << v << "'\n"; std::exit(2); }
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--spots")      f.spots_path = need("--spots");
    else if (a == "--city")       f.city = need("--city");
    else if (a == "--config")     f.config_path = need("--config");
    else if (a == "--itinerary")  f.itinerary_path = need("--itinerary");
    else if (a == "--out")        f.out_path = need("--out");
    else if (a == "--days")       f.days = static_cast<int>(need_int("--days"));
    else if (a == "--mode")       f.mode = need("--mode");
    else if (a == "--trials")     f.trials = static_cast<int>(need_int("--trials"));
    else if (a == "--seed")       f.seed = need_int("--seed");
    else if (a == "--partition")  f.partition = need("--partition");
    else if (a == "--acceptance") f.acceptance = need("--acceptance");
    else if (a == "--polish")     f.polish_seconds = static_cast<int>(need_int("--polish"));
    else if (a == "--repair")     f.repair = true;
    else if (a == "--balance")    f.balance = true;
    else if (a == "--quiet")      f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.spots_path.empty() || f.city.empty()) {
    std::cerr << "Missing required --spots/--city.\n"; print_usage(); std::exit(2);
  }
  return f;
}

static void apply_overrides(const Flags& f, PlannerConfig& c) {
  if (f.days) c.days = *f.days;
  if (f.mode) c.mode = parse_mode(*f.mode);
  if (f.trials) c.search.trials = *f.trials;
  if (f.seed) c.search.seed = static_cast<std::uint64_t>(*f.seed);
  if (f.partition) c.search.partition = *f.partition;
  if (f.acceptance) c.search.acceptance = *f.acceptance;
  if (f.polish_seconds) c.polish_seconds = *f.polish_seconds;
  if (f.repair) c.repair = true;
  if (f.balance) c.balance = true;
  if (!f.out_path.empty()) c.result_out = f.out_path;
  c.search.verbose = f.verbose;
  if (c.days <= 0) throw std::invalid_argument("--days must be positive");
}

static void print_report(double score, const std::vector<std::string>& reasons) {
  std::cout << "Best score: " << std::fixed << std::setprecision(2) << score << "\n";
  if (reasons.empty()) {
    std::cout << "Self-check report: no penalties\n";
    return;
  }
  std::cout << "Self-check report:\n";
  for (const auto& r : reasons) std::cout << " - " << r << "\n";
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);

  if (flags.verbose) std::cout << "🗺️  Trip planner: " << flags.city << "\n";

  PlannerConfig cfg;
  std::vector<Spot> spots;
  std::optional<Itinerary> given;
  try {
    if (!flags.config_path.empty()) cfg = parse_config(load_json(flags.config_path));
    apply_overrides(flags, cfg);

    spots = load_spots(flags.spots_path);
    const int filled = apply_spot_defaults(spots);
    validate_spots(spots);
    if (flags.verbose) {
      std::cout << "Loaded " << spots.size() << " spots (" << filled << " with defaults filled)\n";
    }
    if (!flags.itinerary_path.empty()) {
      given = itinerary_from_json(load_json(flags.itinerary_path));
      if (!is_partition_of(*given, spots))
        throw std::runtime_error("itinerary " + flags.itinerary_path + " does not hold each spot exactly once");
    }
  } catch (const std::exception& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return 1;
  }

  if (flags.verbose) {
    std::cout << "Config: days=" << cfg.days
              << " mode=" << (cfg.mode ? mode_name(*cfg.mode) : "distance")
              << " trials=" << cfg.search.trials
              << " seed=" << cfg.search.seed
              << " partition=" << cfg.search.partition
              << " acceptance=" << cfg.search.acceptance << "\n";
  }

  Itinerary itinerary;
  json result;
  std::optional<RepairReport> repair;
  int swaps = 0, polished = 0;
  try {
    long long t0 = NowMillis();
    if (given) {
      itinerary = *given;
    } else {
      SearchResult sr = optimize(flags.city, spots, cfg.days, cfg.score, cfg.search, cfg.mode);
      itinerary = std::move(sr.best);
      if (flags.verbose) {
        std::cout << "Search: trials=" << sr.stats.trials
                  << " move=" << sr.stats.move_ops
                  << " swap=" << sr.stats.swap_ops
                  << " noop=" << sr.stats.noop_moves
                  << " accepted=" << sr.stats.accepted
                  << " improved=" << sr.stats.improved
                  << " (" << (NowMillis() - t0) << " ms)\n";
      }
    }

    if (cfg.repair) {
      repair = repair_itinerary(itinerary, cfg.hard, cfg.mode, flags.verbose);
      // route repair for the days that received spots
      for (const auto& m : repair->moved) resequence_day(itinerary.days[m.to_day - 1], cfg.mode);
      if (repair->lost_spots())
        std::cerr << "⚠️ Hard repair dropped " << repair->dropped.size() << " spot(s): no destination day\n";
    }
    if (cfg.balance) {
      swaps = balance_itinerary(itinerary, flags.verbose);
    }
    if (cfg.polish_seconds > 0) {
      RouteSolveParams rp;
      rp.time_limit_seconds = cfg.polish_seconds;
      rp.verbose = flags.verbose;
      polished = polish_routes(itinerary, rp, cfg.mode);
    }
  } catch (const std::exception& e) {
    std::cerr << "Failed to plan itinerary: " << e.what() << "\n"; return 3;
  }

  const ScoreResult final_score = score_itinerary(itinerary, cfg.score, cfg.mode);
  const auto hard = check_hard_constraints(itinerary, cfg.hard, cfg.mode);

  result = itinerary_to_json(itinerary, cfg.mode);
  result["score"] = final_score.score;
  result["reasons"] = final_score.reasons;
  result["hard_violations"] = violations_to_json(hard);
  if (repair) result["repair"] = repair_report_to_json(*repair);
  result["meta"] = {{"balance_swaps", swaps},
                    {"polished_days", polished},
                    {"partition_ok", is_partition_of(itinerary, spots)}};

  try { save_json(cfg.result_out, result); }
  catch (const std::exception& e) { std::cerr << "Failed to write result: " << e.what() << "\n"; return 4; }

  if (flags.verbose) {
    print_report(final_score.score, final_score.reasons);
    if (!hard.empty()) std::cout << "Hard cap still exceeded on " << hard.size() << " day(s)\n";
    std::cout << "✅ Result written to " << cfg.result_out << "\n";
  }
  return 0;
}
