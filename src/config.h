// config.h
#pragma once
#include "types.h"
#include <nlohmann/json.hpp>
#include <string>

namespace tourplan {

struct PlannerConfig {
  double threshold_pct = 10.0;        // THRESHOLD_PCT
  TravelMode default_mode = TravelMode::Walk;
  std::string reference_date;         // "YYYY-MM-DD", empty = today
  bool parallel_selection = true;
  size_t geocode_cache_capacity = 128;

  // OR-Tools comparison run
  bool reference_solver = false;
  int reference_time_limit_seconds = 2;

  std::string result_out = "itinerary.json";
  bool log_progress = true;
};

// Upper-case keys with defaults; unknown keys are ignored.
PlannerConfig parse_config(const nlohmann::json& j);

} // namespace tourplan
