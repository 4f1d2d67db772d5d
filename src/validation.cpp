#include "validation.h"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace tourplan
{

    [[noreturn]] static void fail(const std::string &msg)
    {
        throw std::runtime_error(msg);
    }

    void validate_stops(const std::vector<StopSpec> &stops, bool need_location)
    {
        for (size_t i = 0; i < stops.size(); ++i)
        {
            const auto &s = stops[i];
            std::ostringstream where;
            where << "stop " << i << " (" << s.name << ")";
            if (s.stay_minutes < 0)
                fail(where.str() + ": stay_minutes must be >= 0");
            if (i == 0 && (s.stay_minutes != 0 || s.open || s.close))
                fail(where.str() + ": the start stop takes no stay_minutes or opening window");
            if (s.open.has_value() != s.close.has_value())
                fail(where.str() + ": open and close must be given together");
            if (need_location && !s.coord && s.address.empty())
                fail(where.str() + ": needs lat/lon or an address");
            if (s.coord)
            {
                if (!std::isfinite(s.coord->lat) || std::abs(s.coord->lat) > 90.0)
                    fail(where.str() + ": latitude out of range");
                if (!std::isfinite(s.coord->lon) || std::abs(s.coord->lon) > 180.0)
                    fail(where.str() + ": longitude out of range");
            }
        }
    }

    void validate_cost_matrix(const CostMatrix &M, const std::string &label)
    {
        if (M.n < 0 || M.m.size() != static_cast<size_t>(M.n) * M.n)
            fail(label + " matrix is not square");
        for (int i = 0; i < M.n; ++i)
        {
            for (int j = 0; j < M.n; ++j)
            {
                const double c = M.at(i, j);
                if (std::isnan(c) || c < 0.0)
                {
                    std::ostringstream oss;
                    oss << label << "[" << i << "][" << j << "] = " << c << " is not a non-negative cost";
                    fail(oss.str());
                }
            }
        }
    }

    void validate_matrix_pair(const MatrixPair &mp, std::size_t stop_count)
    {
        validate_cost_matrix(mp.distance_km, "distance_km");
        validate_cost_matrix(mp.duration_s, "duration_s");
        if (static_cast<size_t>(mp.distance_km.n) != stop_count ||
            static_cast<size_t>(mp.duration_s.n) != stop_count)
        {
            fail("matrix size does not match the " + std::to_string(stop_count) + " stops");
        }
    }

    void validate_threshold(double threshold_pct)
    {
        if (!std::isfinite(threshold_pct) || threshold_pct < 0.0 || threshold_pct > 100.0)
            fail("THRESHOLD_PCT must lie in [0, 100]");
    }

    void validate_all(const PlanRequest &req, const PlannerConfig &cfg)
    {
        validate_threshold(cfg.threshold_pct);
        validate_stops(req.stops, !req.matrix.has_value());
        if (req.matrix)
            validate_matrix_pair(*req.matrix, req.stops.size());
        if (cfg.reference_time_limit_seconds <= 0)
            fail("REFERENCE_TIME_LIMIT_SECONDS must be positive");
    }

} // namespace tourplan
