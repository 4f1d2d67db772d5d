// validation.h
#pragma once
#include "config.h"
#include "parse.h"
#include "types.h"

namespace tourplan {

// Shape checks on already-parsed input. Each throws std::runtime_error
// naming the offending field; malformed time strings are left to the
// planner, which reports them as InvalidWindowSpec.
void validate_all(const PlanRequest& req, const PlannerConfig& cfg);

// Coordinates (or an address) are required unless the request carries its own matrix.
// Stop 0 is the departure point and takes no stay or opening window.
void validate_stops(const std::vector<StopSpec>& stops, bool need_location);
void validate_cost_matrix(const CostMatrix& M, const std::string& label);
void validate_matrix_pair(const MatrixPair& mp, std::size_t stop_count);
void validate_threshold(double threshold_pct);

} // namespace tourplan
