// reference_solver.h
#pragma once
#include "types.h"
#include "tour_builder.h"

namespace tourplan {

struct ReferenceSolveParams {
  int time_limit_seconds = 2;
  bool log_search = false;
  double cost_scale = 1000.0;   // costs are rounded to int64 after scaling
};

// Open-path tour from `start` solved with the OR-Tools routing library.
// Only used to measure the heuristic; never replaces its tour.
TourResult solve_reference_tour(const CostMatrix& M, int start,
                                const ReferenceSolveParams& params);

// (heuristic - reference) / reference * 100; 0 when the reference length is 0.
double reference_gap_pct(double heuristic_length, double reference_length);

} // namespace tourplan
