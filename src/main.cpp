// main.cpp
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>
#include "config.h"
#include "geocode_cache.h"
#include "itinerary.h"
#include "parse.h"
#include "planner.h"
#include "routing_provider.h"
#include "utils.h"
#include "validation.h"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace tourplan;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string request_path;   // required
  std::string config_path;    // optional
  std::string out_path;       // overrides RESULT_OUT
  bool verbose = true;        // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  tourplan --request request.json [--config config.json] [--out itinerary.json] [--quiet]

Required:
  --request PATH      Stops, departure time, travel mode(s)

Optional:
  --config PATH       Planner settings (THRESHOLD_PCT, REFERENCE_DATE, ...)
  --out PATH          Where to write the JSON itinerary
  --quiet             Less logging
  --help
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--request") f.request_path = need("--request");
    else if (a == "--config")  f.config_path = need("--config");
    else if (a == "--out")     f.out_path = need("--out");
    else if (a == "--quiet")   f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.request_path.empty()) {
    std::cerr << "Missing required --request.\n"; print_usage(); std::exit(2);
  }
  return f;
}

// ---------------- Small utils ----------------
static json load_json(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open file: " + path);
  json j; in >> j; return j;
}
static void save_json(const std::string& path, const json& j) {
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write file: " + path);
  out << std::setw(2) << j << "\n";
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);

  PlanRequest req;
  PlannerConfig cfg;
  try {
    const json req_json = load_json(flags.request_path);
    const json cfg_json = flags.config_path.empty() ? json() : load_json(flags.config_path);
    cfg = parse_config(cfg_json);
    req = parse_request(req_json);
    validate_all(req, cfg);
  } catch (const std::exception& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return 1;
  }
  if (!flags.verbose) cfg.log_progress = false;
  if (!flags.out_path.empty()) cfg.result_out = flags.out_path;

  if (cfg.log_progress) {
    std::cout << "tourplan: " << req.stops.size() << " stops, departure " << req.departure
              << ", reference date " << cfg.reference_date
              << ", threshold " << cfg.threshold_pct << "%\n";
  }

  GeocodeCache cache(cfg.geocode_cache_capacity);
  GazetteerGeocoder gazetteer(req.gazetteer);
  CachingGeocoder geocoder(gazetteer, cache);
  HaversineRoutingProvider router;

  const long long t0 = NowMillis();
  PlanResult result;
  try {
    result = plan(req, geocoder, &router, cfg);
  } catch (const std::exception& e) {
    std::cerr << "Planning failed: " << e.what() << "\n"; return 3;
  }
  const long long t1 = NowMillis();

  const std::vector<std::string> names = stop_names(req);
  const json out = plan_to_json(result, names, cfg.reference_date);
  try { save_json(cfg.result_out, out); }
  catch (const std::exception& e) { std::cerr << "Failed to write result: " << e.what() << "\n"; return 4; }

  if (!result.status.ok()) {
    std::cerr << "Planning failed [" << to_string(result.status.code) << "]: "
              << result.status.message << "\n";
    return 3;
  }

  std::cout << format_itinerary_text(result, names) << "\n";
  if (cfg.log_progress) {
    std::cout << "geocode cache: hits=" << cache.hits << " misses=" << cache.misses << "\n";
    std::cout << "Planned in " << (t1 - t0) << " ms, written to " << cfg.result_out << "\n";
  }
  return 0;
}
