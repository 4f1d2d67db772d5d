// routing_provider.h
#pragma once
#include "types.h"
#include <optional>
#include <string>
#include <vector>

namespace tourplan {

constexpr double kEarthRadiusKm = 6371.0;

struct MatrixPair {
  CostMatrix distance_km;
  CostMatrix duration_s;
};

// Average speed assumed when no routing table is available.
double fallback_speed_kmh(TravelMode mode);

// "walk" / "drive", case-insensitive. Anything else travels as Walk.
TravelMode parse_travel_mode(const std::string& label);

double haversine_km(const Coordinate& a, const Coordinate& b);

MatrixPair haversine_matrices(const std::vector<Coordinate>& coords, double speed_kmh);

// Source of road-network distance/duration tables.
class RoutingProvider {
public:
  virtual ~RoutingProvider() = default;
  // nullopt when the provider cannot serve this request.
  virtual std::optional<MatrixPair> table(const std::vector<Coordinate>& coords,
                                          TravelMode mode) = 0;
};

class HaversineRoutingProvider : public RoutingProvider {
public:
  std::optional<MatrixPair> table(const std::vector<Coordinate>& coords,
                                  TravelMode mode) override;
};

// Provider result, or the great-circle estimate when it has none.
// `used_fallback` is set when the estimate was used.
MatrixPair compute_matrices(RoutingProvider* provider,
                            const std::vector<Coordinate>& coords,
                            TravelMode mode,
                            bool* used_fallback = nullptr);

} // namespace tourplan
