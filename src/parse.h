// parse.h
#pragma once
#include "types.h"
#include "routing_provider.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tourplan {

struct StopSpec {
  std::string name;
  std::string address;                   // geocoded when `coord` is absent
  std::optional<Coordinate> coord;
  int stay_minutes = 0;
  std::optional<std::string> open;       // "HH:MM"
  std::optional<std::string> close;
  std::optional<TravelMode> mode;        // mode of the leg arriving here
};

// stops[0] is the start.
struct PlanRequest {
  std::string departure = "09:00";
  std::optional<TravelMode> mode;        // used for every leg without its own mode
  std::vector<StopSpec> stops;
  std::optional<MatrixPair> matrix;      // precomputed routing table, rows in stop order
  std::unordered_map<std::string, Coordinate> gazetteer;
};

// 2-D array or {"n": N, "data": [N*N]}; null entries are unreachable.
CostMatrix parse_cost_matrix(const nlohmann::json& j);

PlanRequest parse_request(const nlohmann::json& j);

std::vector<std::string> stop_names(const PlanRequest& req);

} // namespace tourplan
