// types.h
#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

namespace tourplan {

// Marks an edge the routing table could not serve.
constexpr double kUnreachable = std::numeric_limits<double>::infinity();

constexpr double kSecondsPerDay = 86400.0;

// Square, row-major view of edge costs. 0 is the start by convention.
struct CostMatrix {
  int n = 0;
  // access with m[src * n + dst]
  std::vector<double> m;

  CostMatrix() = default;
  explicit CostMatrix(int size, double fill = 0.0)
      : n(size), m(static_cast<size_t>(size) * size, fill) {}

  inline double at(int i, int j) const { return m[static_cast<size_t>(i) * n + j]; }
  inline double& at(int i, int j) { return m[static_cast<size_t>(i) * n + j]; }

  static CostMatrix from_rows(const std::vector<std::vector<double>>& rows);
};

// Visiting order over location indices; tour[0] is the start.
using Tour = std::vector<int>;

struct Coordinate {
  double lat = 0.0;
  double lon = 0.0;
};

// Seconds after midnight (0..86399).
struct TimeOfDay {
  int seconds = 0;
  int hour() const { return seconds / 3600; }
  int minute() const { return (seconds % 3600) / 60; }
};

struct OpeningWindow {
  TimeOfDay open;
  TimeOfDay close;
};

enum class FeasibilityStatus { OnTime, TooEarly, TooLate };

enum class Criterion { Time, Distance, Custom };

enum class TravelMode { Walk, Drive };

enum class PlanError {
  None,
  EmptyInput,
  InvalidWindowSpec,
  InvalidDepartureTime,
  NoFeasibleTour,
  GeocodeFailed,
  InvalidRequest
};

// Outcome carried by every fallible operation in the planner.
struct Status {
  PlanError code = PlanError::None;
  std::string message;

  bool ok() const { return code == PlanError::None || code == PlanError::EmptyInput; }

  static Status Ok() { return {}; }
  static Status Error(PlanError c, std::string msg) { return {c, std::move(msg)}; }
};

struct ScheduledStop {
  int location_index = 0;
  double arrival_s = 0.0;    // seconds since reference midnight
  double departure_s = 0.0;  // arrival_s + stay * 60
  FeasibilityStatus status = FeasibilityStatus::OnTime;
  int day_offset = 0;        // whole days after the reference date
};

struct Schedule {
  Status status;
  std::vector<ScheduledStop> stops;
  bool crosses_midnight = false;
};

// Per-location inputs of the projection, indexed by location.
struct StopProfile {
  std::vector<int> stay_minutes;
  std::vector<std::optional<OpeningWindow>> windows;
};

const char* to_string(FeasibilityStatus s);
const char* to_string(Criterion c);
const char* to_string(TravelMode m);
const char* to_string(PlanError e);

} // namespace tourplan
