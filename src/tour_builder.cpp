#include "tour_builder.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <string>

namespace tourplan
{

    double tour_length(const Tour &tour, const CostMatrix &M)
    {
        double len = 0.0;
        for (size_t i = 0; i + 1 < tour.size(); ++i)
            len += M.at(tour[i], tour[i + 1]);
        return len;
    }

    Status nearest_neighbor(const CostMatrix &M, int start, Tour &out)
    {
        out.clear();
        const int n = M.n;
        if (static_cast<size_t>(n) * n != M.m.size())
            throw std::invalid_argument("Cost matrix is not square.");
        if (n == 0)
            return Status::Error(PlanError::EmptyInput, "no locations");
        if (start < 0 || start >= n)
            throw std::invalid_argument("Start index " + std::to_string(start) + " out of range.");

        // ordered so that ties resolve to the lowest index
        std::set<int> unvisited;
        for (int i = 0; i < n; ++i)
            if (i != start)
                unvisited.insert(i);

        out.reserve(n);
        out.push_back(start);
        int current = start;
        while (!unvisited.empty())
        {
            int next = -1;
            double best = kUnreachable;
            for (int j : unvisited)
            {
                const double c = M.at(current, j);
                if (c < best)
                {
                    best = c;
                    next = j;
                }
            }
            if (next < 0)
            {
                return Status::Error(PlanError::NoFeasibleTour,
                                     "location " + std::to_string(current) +
                                         " has no reachable unvisited neighbor");
            }
            out.push_back(next);
            unvisited.erase(next);
            current = next;
        }
        return Status::Ok();
    }

    Tour two_opt(const Tour &tour, const CostMatrix &M)
    {
        Tour best = tour;
        double best_len = tour_length(best, M);
        const int n = static_cast<int>(best.size());

        bool improved = true;
        while (improved)
        {
            improved = false;
            // Edges i = (i-1, i) and j = (j-1, j); reversing [i, j) swaps them.
            for (int i = 1; i < n - 2 && !improved; ++i)
            {
                for (int j = i + 1; j < n - 1; ++j)
                {
                    if (j - i == 1)
                        continue;
                    Tour cand = best;
                    std::reverse(cand.begin() + i, cand.begin() + j);
                    const double len = tour_length(cand, M);
                    if (len < best_len)
                    {
                        best = std::move(cand);
                        best_len = len;
                        improved = true;
                        break;
                    }
                }
            }
        }
        return best;
    }

    TourResult build_tour(const CostMatrix &M, int start)
    {
        TourResult r;
        Tour initial;
        r.status = nearest_neighbor(M, start, initial);
        if (!r.status.ok() || initial.empty())
            return r;
        r.tour = two_opt(initial, M);
        r.length = tour_length(r.tour, M);
        return r;
    }

} // namespace tourplan
