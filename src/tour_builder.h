// tour_builder.h
#pragma once
#include "types.h"

namespace tourplan {

struct TourResult {
  Status status;
  Tour tour;
  double length = 0.0;   // open path, no closing edge
};

// Sum of consecutive edges along the tour.
double tour_length(const Tour& tour, const CostMatrix& M);

// Greedy construction from `start`. Ties go to the lowest index.
// Fails with NoFeasibleTour when only unreachable candidates remain.
Status nearest_neighbor(const CostMatrix& M, int start, Tour& out);

// First-improvement 2-opt over the open path; tour[0] stays fixed.
// Returns a new tour, the input is left untouched.
Tour two_opt(const Tour& tour, const CostMatrix& M);

// nearest_neighbor followed by two_opt.
TourResult build_tour(const CostMatrix& M, int start = 0);

} // namespace tourplan
