#include "config.h"
#include "routing_provider.h"
#include "utils.h"

namespace tourplan {

PlannerConfig parse_config(const nlohmann::json& j) {
  if (!j.is_null() && !j.is_object()) throw std::runtime_error("Config must be a JSON object.");
  if (j.is_null()) {
    PlannerConfig c;
    c.reference_date = today_ymd();
    return c;
  }

  const int cache_cap = j.value("GEOCODE_CACHE_CAPACITY", 128);
  PlannerConfig c{
    /*threshold_pct*/                j.value("THRESHOLD_PCT", 10.0),
    /*default_mode*/                 parse_travel_mode(j.value("DEFAULT_MODE", std::string("walk"))),
    /*reference_date*/               j.value("REFERENCE_DATE", std::string()),
    /*parallel_selection*/           j.value("PARALLEL_SELECTION", true),
    /*geocode_cache_capacity*/       static_cast<size_t>(cache_cap < 0 ? 0 : cache_cap),
    /*reference_solver*/             j.value("REFERENCE_SOLVER", false),
    /*reference_time_limit_seconds*/ j.value("REFERENCE_TIME_LIMIT_SECONDS", 2),
    /*result_out*/                   j.value("RESULT_OUT", std::string("itinerary.json")),
    /*log_progress*/                 j.value("LOG_PROGRESS", true)
  };
  if (c.reference_date.empty()) c.reference_date = today_ymd();
  else parse_ymd(c.reference_date); // throws on a malformed date
  return c;
}

} // namespace tourplan
