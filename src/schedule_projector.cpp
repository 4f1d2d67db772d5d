#include "schedule_projector.h"

#include <cctype>
#include <cmath>
#include <stdexcept>

namespace tourplan
{

    static std::string trim(const std::string &s)
    {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
            ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
            --e;
        return s.substr(b, e - b);
    }

    static bool parse_small_int(const std::string &s, int max_digits, int &out)
    {
        if (s.empty() || static_cast<int>(s.size()) > max_digits)
            return false;
        int v = 0;
        for (char c : s)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return false;
            v = v * 10 + (c - '0');
        }
        out = v;
        return true;
    }

    bool parse_time_of_day(const std::string &text, TimeOfDay &out)
    {
        const std::string t = trim(text);
        const auto colon = t.find(':');
        if (colon == std::string::npos)
            return false;
        int h = 0, m = 0;
        if (!parse_small_int(t.substr(0, colon), 2, h) ||
            !parse_small_int(t.substr(colon + 1), 2, m))
            return false;
        if (h > 23 || m > 59)
            return false;
        out.seconds = h * 3600 + m * 60;
        return true;
    }

    Status parse_opening_window(const std::string &open, const std::string &close,
                                OpeningWindow &out)
    {
        OpeningWindow w;
        if (!parse_time_of_day(open, w.open))
            return Status::Error(PlanError::InvalidWindowSpec, "bad opening time '" + open + "'");
        if (!parse_time_of_day(close, w.close))
            return Status::Error(PlanError::InvalidWindowSpec, "bad closing time '" + close + "'");
        out = w;
        return Status::Ok();
    }

    FeasibilityStatus window_status(double arrival_s, const std::optional<OpeningWindow> &w)
    {
        if (!w)
            return FeasibilityStatus::OnTime;
        // window sits on the arrival's own calendar day
        const double clock = std::fmod(arrival_s, kSecondsPerDay);
        if (clock < w->open.seconds)
            return FeasibilityStatus::TooEarly;
        if (clock > w->close.seconds)
            return FeasibilityStatus::TooLate;
        return FeasibilityStatus::OnTime;
    }

    Schedule project_schedule_legs(const Tour &order,
                                   const std::vector<double> &legs_s,
                                   const StopProfile &profile,
                                   TimeOfDay departure)
    {
        Schedule out;
        if (order.empty())
        {
            out.status = Status::Error(PlanError::EmptyInput, "empty visiting order");
            return out;
        }
        if (legs_s.size() != order.size() - 1)
            throw std::invalid_argument("Expected " + std::to_string(order.size() - 1) +
                                        " leg durations, got " + std::to_string(legs_s.size()));

        out.stops.reserve(order.size());
        double current = departure.seconds;
        for (size_t k = 0; k < order.size(); ++k)
        {
            const int loc = order[k];
            if (loc < 0)
                throw std::invalid_argument("Negative location index in visiting order.");

            ScheduledStop st;
            st.location_index = loc;
            st.arrival_s = current;

            const std::optional<OpeningWindow> none;
            const auto &w = static_cast<size_t>(loc) < profile.windows.size() ? profile.windows[loc] : none;
            st.status = window_status(st.arrival_s, w);

            const int stay = static_cast<size_t>(loc) < profile.stay_minutes.size() ? profile.stay_minutes[loc] : 0;
            st.departure_s = st.arrival_s + stay * 60.0;
            st.day_offset = static_cast<int>(std::floor(st.arrival_s / kSecondsPerDay));
            if (st.day_offset > 0)
                out.crosses_midnight = true;

            out.stops.push_back(st);

            if (k + 1 < order.size())
            {
                const double leg = legs_s[k];
                if (!std::isfinite(leg) || leg < 0.0)
                {
                    out.status = Status::Error(PlanError::NoFeasibleTour,
                                               "leg " + std::to_string(loc) + " -> " +
                                                   std::to_string(order[k + 1]) + " is unreachable");
                    out.stops.clear();
                    return out;
                }
                current = st.departure_s + leg;
            }
        }
        return out;
    }

    Schedule project_schedule(const Tour &order,
                              const CostMatrix &duration_s,
                              const StopProfile &profile,
                              TimeOfDay departure)
    {
        std::vector<double> legs;
        if (order.size() > 1)
            legs.reserve(order.size() - 1);
        for (size_t k = 0; k + 1 < order.size(); ++k)
        {
            const int a = order[k], b = order[k + 1];
            if (a < 0 || b < 0 || a >= duration_s.n || b >= duration_s.n)
                throw std::invalid_argument("Visiting order index outside the duration matrix.");
            legs.push_back(duration_s.at(a, b));
        }
        return project_schedule_legs(order, legs, profile, departure);
    }

} // namespace tourplan
