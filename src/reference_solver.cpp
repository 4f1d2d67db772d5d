#include "reference_solver.h"

#include <cmath>
#include <iostream>
#include <stdexcept>

#include <ortools/constraint_solver/routing.h>
#include <ortools/constraint_solver/routing_parameters.h>

using operations_research::Assignment;
using operations_research::RoutingIndexManager;
using operations_research::RoutingModel;
using operations_research::RoutingSearchParameters;

namespace tourplan
{

    namespace
    {
        // Large enough to never be preferred over a finite edge.
        constexpr int64_t kUnreachableCost = int64_t(1) << 40;

        int64_t scaled(double c, double scale)
        {
            if (!std::isfinite(c))
                return kUnreachableCost;
            return static_cast<int64_t>(std::llround(c * scale));
        }
    } // namespace

    TourResult solve_reference_tour(const CostMatrix &M, int start,
                                    const ReferenceSolveParams &params)
    {
        TourResult out;
        const int n = M.n;
        if (n == 0)
        {
            out.status = Status::Error(PlanError::EmptyInput, "no locations");
            return out;
        }
        if (start < 0 || start >= n)
            throw std::invalid_argument("Start index " + std::to_string(start) + " out of range.");
        if (n == 1)
        {
            out.tour = {start};
            return out;
        }

        // Node n is a free end: reaching it costs nothing, so the route is an open path.
        const int dummy_end = n;
        std::vector<int64_t> cost(static_cast<size_t>(n + 1) * (n + 1), 0);
        for (int i = 0; i < n; ++i)
            for (int j = 0; j < n; ++j)
                cost[i * (n + 1) + j] = (i == j) ? 0 : scaled(M.at(i, j), params.cost_scale);

        RoutingIndexManager manager(
            /*num_nodes=*/n + 1,
            /*num_vehicles=*/1,
            /*starts=*/std::vector<RoutingIndexManager::NodeIndex>{RoutingIndexManager::NodeIndex(start)},
            /*ends=*/std::vector<RoutingIndexManager::NodeIndex>{RoutingIndexManager::NodeIndex(dummy_end)});
        RoutingModel routing(manager);

        const int transit_cb = routing.RegisterTransitCallback(
            [&manager, &cost, n](int64_t from_index, int64_t to_index) -> int64_t
            {
                const int from = manager.IndexToNode(from_index).value();
                const int to = manager.IndexToNode(to_index).value();
                return cost[from * (n + 1) + to];
            });
        routing.SetArcCostEvaluatorOfAllVehicles(transit_cb);

        RoutingSearchParameters p = operations_research::DefaultRoutingSearchParameters();
        p.set_first_solution_strategy(operations_research::FirstSolutionStrategy::PATH_CHEAPEST_ARC);
        p.set_local_search_metaheuristic(operations_research::LocalSearchMetaheuristic::GUIDED_LOCAL_SEARCH);
        p.set_log_search(params.log_search);
        p.mutable_time_limit()->set_seconds(params.time_limit_seconds);

        const Assignment *assignment = routing.SolveWithParameters(p);
        if (!assignment)
        {
            if (params.log_search)
                std::cerr << "[reference] no solution: N=" << n << "\n";
            out.status = Status::Error(PlanError::NoFeasibleTour, "reference solver found no tour");
            return out;
        }

        int64_t idx = routing.Start(0);
        while (!routing.IsEnd(idx))
        {
            out.tour.push_back(manager.IndexToNode(idx).value());
            idx = assignment->Value(routing.NextVar(idx));
        }

        out.length = tour_length(out.tour, M);
        if (!std::isfinite(out.length))
        {
            out.status = Status::Error(PlanError::NoFeasibleTour, "reference tour uses an unreachable edge");
            out.tour.clear();
        }
        return out;
    }

    double reference_gap_pct(double heuristic_length, double reference_length)
    {
        if (reference_length == 0.0)
            return 0.0;
        return (heuristic_length - reference_length) / reference_length * 100.0;
    }

} // namespace tourplan
