// planner.h
#pragma once
#include "config.h"
#include "dual_criterion.h"
#include "geocode_cache.h"
#include "parse.h"
#include "routing_provider.h"
#include "schedule_projector.h"
#include "types.h"
#include <optional>
#include <vector>

namespace tourplan {

// Everything a renderer needs: order, timings, how the order was chosen.
struct PlanResult {
  Status status;
  Tour tour;
  std::vector<ScheduledStop> stops;
  Criterion criterion = Criterion::Time;
  double total_duration_s = 0.0;    // travel only, dwell excluded
  bool crosses_midnight = false;
  bool used_fallback_routing = false;
  std::optional<double> reference_gap_pct;
};

// Parses every stop's window; InvalidWindowSpec on the first bad one.
Status build_stop_profile(const PlanRequest& req, StopProfile& out);

// Given coordinates first, then the geocoder for the rest.
Status resolve_coordinates(const PlanRequest& req, Geocoder& geocoder,
                           std::vector<Coordinate>& out);

// Mode of each leg k -> k+1 (size N-1); stops without one inherit the request/config default.
std::vector<TravelMode> leg_modes(const PlanRequest& req, const PlannerConfig& cfg);

// One travel mode for all legs: best of the time and distance tours.
PlanResult plan_optimized(const MatrixPair& mp, const StopProfile& profile,
                          TimeOfDay departure, const PlannerConfig& cfg);

// Mixed modes: stops visited in the given order with per-leg durations.
PlanResult plan_sequential(const std::vector<double>& legs_s, const StopProfile& profile,
                           TimeOfDay departure);

PlanResult plan(const PlanRequest& req, Geocoder& geocoder, RoutingProvider* provider,
                const PlannerConfig& cfg);

} // namespace tourplan
