// geocode_cache.h
#pragma once
#include "types.h"
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tourplan {

// Failed lookups are cached as nullopt so they are not retried.
using GeocodeValue = std::optional<Coordinate>;

// Bounded LRU keyed by the normalised address. Caller-owned, not thread-safe.
struct GeocodeCache {
  size_t capacity = 128;

  std::list<std::string> order;   // front = most recently used
  using ListIt = std::list<std::string>::iterator;

  std::unordered_map<std::string, std::pair<ListIt, GeocodeValue>> map;

  int hits = 0, misses = 0;

  explicit GeocodeCache(size_t cap = 128) : capacity(cap) {}

  static std::string kstr(const std::string& address);

  bool get(const std::string& address, GeocodeValue& out);
  void put(const std::string& address, const GeocodeValue& v);
  size_t size() const { return map.size(); }
};

// Address -> coordinate lookup.
class Geocoder {
public:
  virtual ~Geocoder() = default;
  virtual GeocodeValue lookup(const std::string& address) = 0;
};

// Resolves names from a fixed table shipped with the request.
class GazetteerGeocoder : public Geocoder {
public:
  explicit GazetteerGeocoder(std::unordered_map<std::string, Coordinate> entries);
  GeocodeValue lookup(const std::string& address) override;
  int lookups = 0;

private:
  std::unordered_map<std::string, Coordinate> entries_;
};

// Consults `cache` before forwarding to `inner`.
class CachingGeocoder : public Geocoder {
public:
  CachingGeocoder(Geocoder& inner, GeocodeCache& cache) : inner_(inner), cache_(cache) {}
  GeocodeValue lookup(const std::string& address) override;

private:
  Geocoder& inner_;
  GeocodeCache& cache_;
};

// All coordinates, or GeocodeFailed naming the first address that did not resolve.
Status geocode_all(Geocoder& geocoder, const std::vector<std::string>& addresses,
                   std::vector<Coordinate>& out);

} // namespace tourplan
