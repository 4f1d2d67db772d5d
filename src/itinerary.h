// itinerary.h
#pragma once
#include "planner.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tourplan {

// "1. <name>: arrive HH:MM, depart HH:MM (too early)" per stop,
// then the total travel time.
std::string format_itinerary_text(const PlanResult& plan, const std::vector<std::string>& names);

nlohmann::json plan_to_json(const PlanResult& plan, const std::vector<std::string>& names,
                            const std::string& reference_date);

} // namespace tourplan
