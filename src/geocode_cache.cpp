#include "geocode_cache.h"
#include <algorithm>
#include <cctype>

namespace tourplan {

std::string GeocodeCache::kstr(const std::string& address) {
  // trim + lowercase + collapse inner blanks
  std::string k;
  k.reserve(address.size());
  bool pending_space = false;
  for (unsigned char c : address) {
    if (std::isspace(c)) { pending_space = !k.empty(); continue; }
    if (pending_space) { k.push_back(' '); pending_space = false; }
    k.push_back(static_cast<char>(std::tolower(c)));
  }
  return k;
}

bool GeocodeCache::get(const std::string& address, GeocodeValue& out) {
  const std::string key = kstr(address);
  auto it = map.find(key);
  if (it == map.end()) { ++misses; return false; }

  // Move the node to the front (MRU)
  order.splice(order.begin(), order, it->second.first);

  out = it->second.second;
  ++hits;
  return true;
}

void GeocodeCache::put(const std::string& address, const GeocodeValue& v) {
  if (capacity == 0) return;
  const std::string key = kstr(address);
  auto it = map.find(key);

  if (it != map.end()) {
    it->second.second = v;
    order.splice(order.begin(), order, it->second.first);
    return;
  }

  // Evict LRU if full
  if (map.size() >= capacity && !order.empty()) {
    map.erase(order.back());
    order.pop_back();
  }

  order.push_front(key);
  map.emplace(key, std::make_pair(order.begin(), v));
}

GazetteerGeocoder::GazetteerGeocoder(std::unordered_map<std::string, Coordinate> entries) {
  for (auto& kv : entries) entries_.emplace(GeocodeCache::kstr(kv.first), kv.second);
}

GeocodeValue GazetteerGeocoder::lookup(const std::string& address) {
  ++lookups;
  auto it = entries_.find(GeocodeCache::kstr(address));
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

GeocodeValue CachingGeocoder::lookup(const std::string& address) {
  GeocodeValue v;
  if (cache_.get(address, v)) return v;
  v = inner_.lookup(address);
  cache_.put(address, v);
  return v;
}

Status geocode_all(Geocoder& geocoder, const std::vector<std::string>& addresses,
                   std::vector<Coordinate>& out) {
  out.clear();
  out.reserve(addresses.size());
  for (const auto& a : addresses) {
    GeocodeValue v = geocoder.lookup(a);
    if (!v) return Status::Error(PlanError::GeocodeFailed, "could not geocode '" + a + "'");
    out.push_back(*v);
  }
  return Status::Ok();
}

} // namespace tourplan
