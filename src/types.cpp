#include "types.h"
#include <stdexcept>

namespace tourplan {

CostMatrix CostMatrix::from_rows(const std::vector<std::vector<double>>& rows) {
  const int n = static_cast<int>(rows.size());
  CostMatrix M(n);
  for (int i = 0; i < n; ++i) {
    if (static_cast<int>(rows[i].size()) != n)
      throw std::invalid_argument("Cost matrix row " + std::to_string(i) + " size mismatch.");
    for (int j = 0; j < n; ++j) M.at(i, j) = rows[i][j];
  }
  return M;
}

const char* to_string(FeasibilityStatus s) {
  switch (s) {
    case FeasibilityStatus::OnTime:   return "on_time";
    case FeasibilityStatus::TooEarly: return "too_early";
    case FeasibilityStatus::TooLate:  return "too_late";
  }
  return "?";
}

const char* to_string(Criterion c) {
  switch (c) {
    case Criterion::Time:     return "time";
    case Criterion::Distance: return "distance";
    case Criterion::Custom:   return "custom";
  }
  return "?";
}

const char* to_string(TravelMode m) {
  switch (m) {
    case TravelMode::Walk:  return "walk";
    case TravelMode::Drive: return "drive";
  }
  return "?";
}

const char* to_string(PlanError e) {
  switch (e) {
    case PlanError::None:                 return "none";
    case PlanError::EmptyInput:           return "empty_input";
    case PlanError::InvalidWindowSpec:    return "invalid_window_spec";
    case PlanError::InvalidDepartureTime: return "invalid_departure_time";
    case PlanError::NoFeasibleTour:       return "no_feasible_tour";
    case PlanError::GeocodeFailed:        return "geocode_failed";
    case PlanError::InvalidRequest:       return "invalid_request";
  }
  return "?";
}

} // namespace tourplan
