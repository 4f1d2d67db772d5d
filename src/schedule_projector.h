// schedule_projector.h
#pragma once
#include "types.h"
#include <string>

namespace tourplan {

// "H:MM" / "HH:MM", hour 0..23, minute 0..59, surrounding blanks ignored.
bool parse_time_of_day(const std::string& text, TimeOfDay& out);

// Fails with InvalidWindowSpec when either bound does not parse.
Status parse_opening_window(const std::string& open, const std::string& close,
                            OpeningWindow& out);

FeasibilityStatus window_status(double arrival_s, const std::optional<OpeningWindow>& w);

// Walks `order`, taking leg k -> k+1 from legs_s[k] (seconds).
// legs_s.size() must be order.size() - 1 (or 0 for an empty order).
Schedule project_schedule_legs(const Tour& order,
                               const std::vector<double>& legs_s,
                               const StopProfile& profile,
                               TimeOfDay departure);

// Same projection, legs drawn from a global duration matrix (seconds).
Schedule project_schedule(const Tour& order,
                          const CostMatrix& duration_s,
                          const StopProfile& profile,
                          TimeOfDay departure);

} // namespace tourplan
