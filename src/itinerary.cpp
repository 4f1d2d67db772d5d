#include "itinerary.h"
#include "utils.h"

#include <sstream>

using json = nlohmann::json;

namespace tourplan
{

    static std::string name_of(const std::vector<std::string> &names, int idx)
    {
        if (idx >= 0 && static_cast<size_t>(idx) < names.size())
            return names[idx];
        return "Stop " + std::to_string(idx + 1);
    }

    static const char *status_label(FeasibilityStatus s)
    {
        switch (s)
        {
        case FeasibilityStatus::TooEarly:
            return "too early";
        case FeasibilityStatus::TooLate:
            return "closed";
        default:
            return "";
        }
    }

    std::string format_itinerary_text(const PlanResult &plan, const std::vector<std::string> &names)
    {
        std::ostringstream out;
        out << "Your itinerary:\n\n";
        int i = 1;
        for (const auto &st : plan.stops)
        {
            out << i++ << ". " << name_of(names, st.location_index)
                << ": arrive " << format_clock(st.arrival_s)
                << ", depart " << format_clock(st.departure_s);
            if (st.status != FeasibilityStatus::OnTime)
                out << " (" << status_label(st.status) << ")";
            if (st.day_offset > 0)
                out << " [+" << st.day_offset << "d]";
            out << "\n";
        }
        const long long total = static_cast<long long>(plan.total_duration_s);
        out << "\nTotal travel time: " << total / 3600 << "h " << (total % 3600) / 60 << "m";
        return out.str();
    }

    json plan_to_json(const PlanResult &plan, const std::vector<std::string> &names,
                      const std::string &reference_date)
    {
        json j;
        j["ok"] = plan.status.ok();
        if (!plan.status.ok())
        {
            j["error"] = {{"code", to_string(plan.status.code)}, {"message", plan.status.message}};
            return j;
        }
        j["criterion"] = to_string(plan.criterion);
        j["total_duration_s"] = plan.total_duration_s;
        j["tour"] = plan.tour;
        j["crosses_midnight"] = plan.crosses_midnight;
        j["used_fallback_routing"] = plan.used_fallback_routing;
        if (plan.reference_gap_pct)
            j["reference_gap_pct"] = *plan.reference_gap_pct;

        json stops = json::array();
        for (const auto &st : plan.stops)
        {
            stops.push_back({{"index", st.location_index},
                             {"name", name_of(names, st.location_index)},
                             {"arrival", iso_timestamp(reference_date, st.arrival_s)},
                             {"departure", iso_timestamp(reference_date, st.departure_s)},
                             {"status", to_string(st.status)},
                             {"day_offset", st.day_offset}});
        }
        j["schedule"] = stops;
        return j;
    }

} // namespace tourplan
