#include "dual_criterion.h"
#include "tour_builder.h"

#include <cmath>
#include <future>
#include <stdexcept>

namespace tourplan
{

    TourSelection select_tour(const CostMatrix &distance_km,
                              const CostMatrix &duration_s,
                              const SelectionOptions &opts)
    {
        if (distance_km.n != duration_s.n)
            throw std::invalid_argument("Distance and duration matrices differ in size.");

        TourSelection sel;

        TourResult time_res, dist_res;
        if (opts.parallel)
        {
            auto time_fut = std::async(std::launch::async, [&]()
                                       { return build_tour(duration_s, opts.start); });
            auto dist_fut = std::async(std::launch::async, [&]()
                                       { return build_tour(distance_km, opts.start); });
            time_res = time_fut.get();
            dist_res = dist_fut.get();
        }
        else
        {
            time_res = build_tour(duration_s, opts.start);
            dist_res = build_tour(distance_km, opts.start);
        }

        if (!time_res.status.ok())
        {
            sel.status = time_res.status;
            return sel;
        }
        sel.status = time_res.status; // carries EmptyInput through

        const double t_time = tour_length(time_res.tour, duration_s);
        const double t_dist = dist_res.status.ok() ? tour_length(dist_res.tour, duration_s) : kUnreachable;
        sel.time_tour_duration_s = t_time;
        sel.distance_tour_duration_s = t_dist;

        if (t_time == 0.0 || !dist_res.status.ok())
        {
            sel.tour = time_res.tour;
            sel.criterion = Criterion::Time;
            sel.total_duration_s = t_time;
            return sel;
        }

        // t_dist may be infinite when a distance edge has no duration; diff is then inf
        sel.diff_pct = std::abs(t_time - t_dist) / t_time * 100.0;
        if (sel.diff_pct <= opts.threshold_pct)
        {
            sel.tour = dist_res.tour;
            sel.criterion = Criterion::Distance;
            sel.total_duration_s = t_dist;
        }
        else
        {
            sel.tour = time_res.tour;
            sel.criterion = Criterion::Time;
            sel.total_duration_s = t_time;
        }
        return sel;
    }

} // namespace tourplan
