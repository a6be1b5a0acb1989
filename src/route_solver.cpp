#include "route_solver.h"
#include "geometry.h"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>

#include <ortools/constraint_solver/routing.h>
#include <ortools/constraint_solver/routing_parameters.h>

using operations_research::Assignment;
using operations_research::RoutingIndexManager;
using operations_research::RoutingModel;
using operations_research::RoutingSearchParameters;

namespace tp {

namespace
{
    // Integer arc costs for the solver: metres or seconds.
    int64_t arc_cost(const Spot &a, const Spot &b, std::optional<TransportMode> mode)
    {
        const double v = mode ? travel_cost(a, b, *mode) * 60.0 : distance(a, b) * 1000.0;
        return static_cast<int64_t>(std::llround(v));
    }

    double measure(const std::vector<Spot> &route, std::optional<TransportMode> mode)
    {
        return mode ? route_minutes(route, *mode) : route_distance_km(route);
    }
} // namespace

std::vector<Spot> solve_day_route(const std::vector<Spot> &spots,
                                  const RouteSolveParams &params,
                                  std::optional<TransportMode> mode)
{
    if (spots.size() < 3)
        return spots;

    // nodes 0..N-1 are spots, node N is a free dummy end so the path stays open
    const int N = static_cast<int>(spots.size());
    const int dummy = N;

    std::vector<int64_t> cost((N + 1) * (N + 1), 0);
    for (int i = 0; i < N; ++i)
        for (int j = 0; j < N; ++j)
            if (i != j)
                cost[i * (N + 1) + j] = arc_cost(spots[i], spots[j], mode);

    RoutingIndexManager manager(
        /*num_nodes=*/N + 1,
        /*num_vehicles=*/1,
        /*starts=*/std::vector<RoutingIndexManager::NodeIndex>{RoutingIndexManager::NodeIndex(0)},
        /*ends=*/std::vector<RoutingIndexManager::NodeIndex>{RoutingIndexManager::NodeIndex(dummy)});
    RoutingModel routing(manager);

    const int transit_cb = routing.RegisterTransitCallback(
        [&manager, &cost, N](int64_t from_index, int64_t to_index) -> int64_t
        {
            const int from = manager.IndexToNode(from_index).value();
            const int to = manager.IndexToNode(to_index).value();
            return cost[from * (N + 1) + to];
        });
    routing.SetArcCostEvaluatorOfAllVehicles(transit_cb);

    RoutingSearchParameters p = operations_research::DefaultRoutingSearchParameters();
    p.set_first_solution_strategy(operations_research::FirstSolutionStrategy::PATH_CHEAPEST_ARC);
    p.set_local_search_metaheuristic(operations_research::LocalSearchMetaheuristic::GUIDED_LOCAL_SEARCH);
    p.set_log_search(params.log_search);
    p.mutable_time_limit()->set_seconds(params.time_limit_seconds > 0 ? params.time_limit_seconds : 1);

    const Assignment *assignment = routing.SolveWithParameters(p);
    if (!assignment)
    {
        if (params.verbose)
            std::cerr << "[route_solver] no assignment for " << N << " spots, keeping order\n";
        return spots;
    }

    std::vector<Spot> route;
    route.reserve(spots.size());
    int64_t idx = routing.Start(0);
    while (!routing.IsEnd(idx))
    {
        const int node = manager.IndexToNode(idx).value();
        if (node != dummy)
            route.push_back(spots[node]);
        idx = assignment->Value(routing.NextVar(idx));
    }

    // every spot must come back exactly once
    if (route.size() != spots.size())
        return spots;
    return route;
}

int polish_routes(Itinerary &it,
                  const RouteSolveParams &params,
                  std::optional<TransportMode> mode)
{
    int changed = 0;
    for (auto &day : it.days)
    {
        if (day.spots.size() < 3)
            continue;

        const double before = measure(day.spots, mode);
        auto candidate = solve_day_route(day.spots, params, mode);
        const double after = measure(candidate, mode);

        if (params.verbose)
        {
            std::cout << "[route_solver] day=" << day.day
                      << " spots=" << day.spots.size()
                      << std::fixed << std::setprecision(2)
                      << " before=" << before << " after=" << after
                      << (mode ? " min" : " km") << "\n";
        }
        if (after + 1e-9 < before)
        {
            day.spots = std::move(candidate);
            ++changed;
        }
    }
    return changed;
}

} // namespace tp
