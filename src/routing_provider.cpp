#include "routing_provider.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace tourplan
{

    double fallback_speed_kmh(TravelMode mode)
    {
        return mode == TravelMode::Drive ? 40.0 : 5.0;
    }

    TravelMode parse_travel_mode(const std::string &label)
    {
        std::string s = label;
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (s == "drive" || s == "driving" || s == "car")
            return TravelMode::Drive;
        // public transport is treated as walking
        return TravelMode::Walk;
    }

    static constexpr double kPi = 3.14159265358979323846;

    static inline double deg2rad(double d) { return d * kPi / 180.0; }

    double haversine_km(const Coordinate &a, const Coordinate &b)
    {
        const double phi1 = deg2rad(a.lat), phi2 = deg2rad(b.lat);
        const double d_phi = deg2rad(b.lat - a.lat);
        const double d_lambda = deg2rad(b.lon - a.lon);
        const double h = std::sin(d_phi / 2) * std::sin(d_phi / 2) +
                         std::cos(phi1) * std::cos(phi2) * std::sin(d_lambda / 2) * std::sin(d_lambda / 2);
        const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
        return kEarthRadiusKm * c;
    }

    MatrixPair haversine_matrices(const std::vector<Coordinate> &coords, double speed_kmh)
    {
        const int n = static_cast<int>(coords.size());
        MatrixPair out{CostMatrix(n), CostMatrix(n)};
        for (int i = 0; i < n; ++i)
        {
            for (int j = 0; j < n; ++j)
            {
                if (i == j)
                    continue;
                const double km = haversine_km(coords[i], coords[j]);
                out.distance_km.at(i, j) = km;
                out.duration_s.at(i, j) = km / speed_kmh * 3600.0;
            }
        }
        return out;
    }

    std::optional<MatrixPair> HaversineRoutingProvider::table(const std::vector<Coordinate> &coords,
                                                              TravelMode mode)
    {
        return haversine_matrices(coords, fallback_speed_kmh(mode));
    }

    MatrixPair compute_matrices(RoutingProvider *provider,
                                const std::vector<Coordinate> &coords,
                                TravelMode mode,
                                bool *used_fallback)
    {
        if (used_fallback)
            *used_fallback = false;
        if (provider)
        {
            auto res = provider->table(coords, mode);
            if (res && res->distance_km.n == static_cast<int>(coords.size()) &&
                res->duration_s.n == static_cast<int>(coords.size()))
                return std::move(*res);
        }
        if (used_fallback)
            *used_fallback = true;
        return haversine_matrices(coords, fallback_speed_kmh(mode));
    }

} // namespace tourplan
