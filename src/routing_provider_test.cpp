#include "routing_provider.h"

#include <gtest/gtest.h>

using namespace tourplan;

namespace {

class UnavailableProvider : public RoutingProvider {
public:
  int calls = 0;
  std::optional<MatrixPair> table(const std::vector<Coordinate>&, TravelMode) override {
    ++calls;
    return std::nullopt;
  }
};

class FixedProvider : public RoutingProvider {
public:
  std::optional<MatrixPair> table(const std::vector<Coordinate>& coords, TravelMode) override {
    const int n = static_cast<int>(coords.size());
    return MatrixPair{CostMatrix(n, 7.0), CostMatrix(n, 70.0)};
  }
};

} // namespace

TEST(Haversine, TokyoTowerToTokyoStation) {
  const Coordinate tower{35.6586, 139.7454};
  const Coordinate station{35.6812, 139.7671};
  EXPECT_NEAR(haversine_km(tower, station), 2.9, 0.5);
  EXPECT_DOUBLE_EQ(haversine_km(tower, tower), 0.0);
}

TEST(Haversine, MatrixUsesModeSpeed) {
  const std::vector<Coordinate> coords{{0, 0}, {0, 1}, {1, 0}};
  const MatrixPair mp = haversine_matrices(coords, 60.0);
  ASSERT_EQ(mp.distance_km.n, 3);
  EXPECT_NEAR(mp.distance_km.at(0, 1), 111.0, 2.0);
  EXPECT_NEAR(mp.duration_s.at(0, 1), 111.0 / 60.0 * 3600.0, 300.0);
  EXPECT_DOUBLE_EQ(mp.distance_km.at(1, 1), 0.0);
  EXPECT_DOUBLE_EQ(mp.distance_km.at(1, 2), mp.distance_km.at(2, 1));
}

TEST(TravelModes, LabelsAndSpeeds) {
  EXPECT_EQ(parse_travel_mode("drive"), TravelMode::Drive);
  EXPECT_EQ(parse_travel_mode("Driving"), TravelMode::Drive);
  EXPECT_EQ(parse_travel_mode("walk"), TravelMode::Walk);
  EXPECT_EQ(parse_travel_mode("transit"), TravelMode::Walk);
  EXPECT_DOUBLE_EQ(fallback_speed_kmh(TravelMode::Walk), 5.0);
  EXPECT_DOUBLE_EQ(fallback_speed_kmh(TravelMode::Drive), 40.0);
}

TEST(ComputeMatrices, FallsBackToGreatCircleEstimate) {
  const std::vector<Coordinate> coords{{35.6586, 139.7454}, {35.6812, 139.7671}};
  UnavailableProvider down;
  bool fallback = false;
  const MatrixPair mp = compute_matrices(&down, coords, TravelMode::Drive, &fallback);
  EXPECT_EQ(down.calls, 1);
  EXPECT_TRUE(fallback);
  const double km = haversine_km(coords[0], coords[1]);
  EXPECT_DOUBLE_EQ(mp.distance_km.at(0, 1), km);
  EXPECT_DOUBLE_EQ(mp.duration_s.at(0, 1), km / 40.0 * 3600.0);

  const MatrixPair none = compute_matrices(nullptr, coords, TravelMode::Walk, &fallback);
  EXPECT_TRUE(fallback);
  EXPECT_DOUBLE_EQ(none.duration_s.at(1, 0), km / 5.0 * 3600.0);
}

TEST(ComputeMatrices, PrefersProviderTable) {
  FixedProvider p;
  bool fallback = true;
  const MatrixPair mp = compute_matrices(&p, {{0, 0}, {1, 1}}, TravelMode::Walk, &fallback);
  EXPECT_FALSE(fallback);
  EXPECT_DOUBLE_EQ(mp.distance_km.at(0, 1), 7.0);
  EXPECT_DOUBLE_EQ(mp.duration_s.at(1, 0), 70.0);
}
