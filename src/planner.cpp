#include "planner.h"
#include "reference_solver.h"
#include "tour_builder.h"
#include "utils.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <numeric>

namespace tourplan
{

    Status build_stop_profile(const PlanRequest &req, StopProfile &out)
    {
        out.stay_minutes.assign(req.stops.size(), 0);
        out.windows.assign(req.stops.size(), std::nullopt);
        for (size_t i = 0; i < req.stops.size(); ++i)
        {
            const auto &s = req.stops[i];
            out.stay_minutes[i] = s.stay_minutes;
            if (!s.open || !s.close)
                continue;
            OpeningWindow w;
            Status st = parse_opening_window(*s.open, *s.close, w);
            if (!st.ok())
            {
                st.message = s.name + ": " + st.message;
                return st;
            }
            out.windows[i] = w;
        }
        return Status::Ok();
    }

    Status resolve_coordinates(const PlanRequest &req, Geocoder &geocoder,
                               std::vector<Coordinate> &out)
    {
        out.assign(req.stops.size(), Coordinate{});
        std::vector<std::string> pending;
        std::vector<size_t> pending_idx;
        for (size_t i = 0; i < req.stops.size(); ++i)
        {
            if (req.stops[i].coord)
            {
                out[i] = *req.stops[i].coord;
                continue;
            }
            pending.push_back(req.stops[i].address);
            pending_idx.push_back(i);
        }
        std::vector<Coordinate> found;
        Status st = geocode_all(geocoder, pending, found);
        if (!st.ok())
            return st;
        for (size_t k = 0; k < pending_idx.size(); ++k)
            out[pending_idx[k]] = found[k];
        return Status::Ok();
    }

    std::vector<TravelMode> leg_modes(const PlanRequest &req, const PlannerConfig &cfg)
    {
        const TravelMode def = req.mode.value_or(cfg.default_mode);
        std::vector<TravelMode> modes;
        for (size_t i = 1; i < req.stops.size(); ++i)
            modes.push_back(req.stops[i].mode.value_or(def));
        return modes;
    }

    PlanResult plan_optimized(const MatrixPair &mp, const StopProfile &profile,
                              TimeOfDay departure, const PlannerConfig &cfg)
    {
        PlanResult out;

        SelectionOptions so;
        so.threshold_pct = cfg.threshold_pct;
        so.parallel = cfg.parallel_selection;
        const TourSelection sel = select_tour(mp.distance_km, mp.duration_s, so);
        if (!sel.status.ok())
        {
            out.status = sel.status;
            return out;
        }
        out.tour = sel.tour;
        out.criterion = sel.criterion;
        out.total_duration_s = sel.total_duration_s;

        if (cfg.log_progress && !sel.tour.empty())
        {
            std::cout << "[planner] time tour=" << std::fixed << std::setprecision(0)
                      << sel.time_tour_duration_s << "s distance tour=" << sel.distance_tour_duration_s
                      << "s diff=" << std::setprecision(2) << sel.diff_pct << "%"
                      << " -> " << to_string(sel.criterion) << "\n";
        }

        if (cfg.reference_solver && out.tour.size() > 1)
        {
            const CostMatrix &M = sel.criterion == Criterion::Distance ? mp.distance_km : mp.duration_s;
            ReferenceSolveParams rp;
            rp.time_limit_seconds = cfg.reference_time_limit_seconds;
            const TourResult ref = solve_reference_tour(M, out.tour.front(), rp);
            if (ref.status.ok())
            {
                out.reference_gap_pct = reference_gap_pct(tour_length(out.tour, M), ref.length);
                if (cfg.log_progress)
                    std::cout << "[reference] heuristic vs OR-Tools gap=" << std::fixed
                              << std::setprecision(2) << *out.reference_gap_pct << "%\n";
            }
            else
            {
                std::cerr << "[reference] " << ref.status.message << "\n";
            }
        }

        const Schedule sch = project_schedule(out.tour, mp.duration_s, profile, departure);
        out.status = sch.status;
        out.stops = sch.stops;
        out.crosses_midnight = sch.crosses_midnight;
        if (!sch.status.ok())
            out.tour.clear();
        return out;
    }

    PlanResult plan_sequential(const std::vector<double> &legs_s, const StopProfile &profile,
                               TimeOfDay departure)
    {
        PlanResult out;
        out.criterion = Criterion::Custom;
        Tour order(legs_s.size() + 1);
        std::iota(order.begin(), order.end(), 0);

        const Schedule sch = project_schedule_legs(order, legs_s, profile, departure);
        out.status = sch.status;
        if (!sch.status.ok())
            return out;
        out.tour = std::move(order);
        out.stops = sch.stops;
        out.crosses_midnight = sch.crosses_midnight;
        out.total_duration_s = std::accumulate(legs_s.begin(), legs_s.end(), 0.0);
        return out;
    }

    PlanResult plan(const PlanRequest &req, Geocoder &geocoder, RoutingProvider *provider,
                    const PlannerConfig &cfg)
    {
        PlanResult out;
        if (req.stops.empty())
        {
            out.status = Status::Error(PlanError::EmptyInput, "no stops");
            return out;
        }

        StopProfile profile;
        out.status = build_stop_profile(req, profile);
        if (!out.status.ok())
            return out;

        TimeOfDay departure;
        if (!parse_time_of_day(req.departure, departure))
        {
            out.status = Status::Error(PlanError::InvalidDepartureTime,
                                       "bad departure time '" + req.departure + "'");
            return out;
        }

        const std::vector<TravelMode> modes = leg_modes(req, cfg);
        const bool single_mode = std::all_of(modes.begin(), modes.end(),
                                             [&](TravelMode m)
                                             { return m == modes.front(); });
        const TravelMode mode = modes.empty() ? req.mode.value_or(cfg.default_mode) : modes.front();
        const int n = static_cast<int>(req.stops.size());

        bool fallback = false;
        if (req.matrix)
        {
            if (single_mode)
            {
                out = plan_optimized(*req.matrix, profile, departure, cfg);
            }
            else
            {
                if (cfg.log_progress)
                    std::cerr << "[planner] per-leg modes given with a single routing table; "
                                 "using the table for every leg\n";
                std::vector<double> legs;
                for (int k = 0; k + 1 < n; ++k)
                    legs.push_back(req.matrix->duration_s.at(k, k + 1));
                out = plan_sequential(legs, profile, departure);
            }
        }
        else
        {
            std::vector<Coordinate> coords;
            out.status = resolve_coordinates(req, geocoder, coords);
            if (!out.status.ok())
                return out;

            if (single_mode)
            {
                const MatrixPair mp = compute_matrices(provider, coords, mode, &fallback);
                out = plan_optimized(mp, profile, departure, cfg);
            }
            else
            {
                std::vector<double> legs;
                for (int k = 0; k + 1 < n; ++k)
                {
                    bool fb = false;
                    const MatrixPair leg = compute_matrices(provider, {coords[k], coords[k + 1]}, modes[k], &fb);
                    fallback = fallback || fb;
                    legs.push_back(leg.duration_s.at(0, 1));
                }
                out = plan_sequential(legs, profile, departure);
            }
        }
        out.used_fallback_routing = fallback;

        if (cfg.log_progress && fallback)
            std::cerr << "[planner] routing table unavailable, used great-circle estimate\n";
        if (out.crosses_midnight)
            std::cerr << "[schedule] itinerary runs past midnight of " << cfg.reference_date
                      << "; opening hours are still checked against that date\n";
        if (cfg.log_progress && out.status.ok())
            std::cout << "[planner] " << out.stops.size() << " stops, criterion="
                      << to_string(out.criterion) << ", travel=" << std::fixed << std::setprecision(0)
                      << out.total_duration_s << "s\n";
        return out;
    }

} // namespace tourplan
