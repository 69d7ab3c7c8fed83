#include "search/visited_table.hpp"

#include <cmath>
#include <cstdio>

namespace searoute {

std::string QuantizedKey(const Point& p, int decimals) {
  const double scale = std::pow(10.0, decimals);
  double lat = std::round(p.lat_deg * scale) / scale;
  double lng = std::round(p.lng_deg * scale) / scale;
  if (lat == 0.0) lat = 0.0;  // 去掉 -0
  if (lng == 0.0) lng = 0.0;

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f,%.*f", decimals, lat, decimals, lng);
  return buf;
}

const VisitedEntry* VisitedTable::Find(const std::string& key) const {
  auto it = entries_.find(key);
  return (it == entries_.end()) ? nullptr : &it->second;
}

bool VisitedTable::Improve(const std::string& key, const VisitedEntry& entry) {
  auto it = entries_.find(key);
  if (it != entries_.end() && entry.g >= it->second.g) return false;
  entries_[key] = entry;
  return true;
}

bool VisitedTable::IsCurrent(const std::string& key, double g) const {
  const VisitedEntry* e = Find(key);
  return e != nullptr && e->g == g;
}

} // namespace searoute
