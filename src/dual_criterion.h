// dual_criterion.h
#pragma once
#include "types.h"

namespace tourplan {

struct SelectionOptions {
  double threshold_pct = 10.0;  // distance tour wins when within this much extra time
  int start = 0;
  bool parallel = false;        // build both candidate tours concurrently
};

struct TourSelection {
  Status status;
  Tour tour;
  Criterion criterion = Criterion::Time;
  double total_duration_s = 0.0;

  // diagnostics
  double time_tour_duration_s = 0.0;
  double distance_tour_duration_s = 0.0;
  double diff_pct = 0.0;
};

TourSelection select_tour(const CostMatrix& distance_km,
                          const CostMatrix& duration_s,
                          const SelectionOptions& opts);

} // namespace tourplan
