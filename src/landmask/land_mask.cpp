#include "landmask/land_mask.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace searoute {

namespace {

using json = nlohmann::json;

BBox RingBBox(const std::vector<Point>& ring) {
  BBox b{1e300, -1e300, 1e300, -1e300};
  for (const auto& p : ring) {
    b.min_lat = std::min(b.min_lat, p.lat_deg);
    b.max_lat = std::max(b.max_lat, p.lat_deg);
    b.min_lng = std::min(b.min_lng, p.lng_deg);
    b.max_lng = std::max(b.max_lng, p.lng_deg);
  }
  return b;
}

inline bool InBBox(const BBox& b, const Point& p) {
  return p.lat_deg >= b.min_lat && p.lat_deg <= b.max_lat &&
         p.lng_deg >= b.min_lng && p.lng_deg <= b.max_lng;
}

// GeoJSON 坐标是 [lng, lat]
std::vector<Point> ParseRing(const json& ring) {
  if (!ring.is_array()) throw std::runtime_error("GeoJSON ring is not an array");
  std::vector<Point> out;
  out.reserve(ring.size());
  for (const auto& v : ring) {
    if (!v.is_array() || v.size() < 2 || !v[0].is_number() || !v[1].is_number()) {
      throw std::runtime_error("GeoJSON position is not [lng, lat]");
    }
    out.push_back({v[1].get<double>(), v[0].get<double>()});
  }
  return out;
}

void AppendOuterRing(const json& polygon_coords, std::vector<LandRing>& rings) {
  if (!polygon_coords.is_array()) throw std::runtime_error("GeoJSON polygon is not an array");
  if (polygon_coords.empty()) return;
  // [0] 是外环，其余是洞；洞不参与判断
  std::vector<Point> outer = ParseRing(polygon_coords.at(0));
  if (outer.size() < 3) return;
  LandRing r;
  r.bbox = RingBBox(outer);
  r.vertices = std::move(outer);
  rings.push_back(std::move(r));
}

void AppendGeometry(const json& geom, std::vector<LandRing>& rings) {
  if (!geom.is_object()) return;  // "geometry": null 合法
  const std::string type = geom.value("type", "");
  if (type == "Polygon") {
    AppendOuterRing(geom.at("coordinates"), rings);
  } else if (type == "MultiPolygon") {
    const json& polys = geom.at("coordinates");
    if (!polys.is_array()) throw std::runtime_error("GeoJSON MultiPolygon is not an array");
    for (const auto& poly : polys) AppendOuterRing(poly, rings);
  } else if (type == "GeometryCollection") {
    for (const auto& g : geom.value("geometries", json::array())) AppendGeometry(g, rings);
  }
  // 其它几何类型（点、线）与陆地判断无关，直接忽略
}

std::shared_ptr<const LandPolygonSet> TryParse(const json& doc, const std::string& what, std::string* err) {
  try {
    auto set = std::make_shared<const LandPolygonSet>(ParseLandGeoJson(doc));
    if (set->empty()) {
      *err = what + ": dataset contains no polygons";
      return nullptr;
    }
    return set;
  } catch (const std::exception& e) {
    *err = what + ": " + e.what();
    return nullptr;
  }
}

} // namespace

LandPolygonSet::LandPolygonSet(std::vector<LandRing> rings) : rings_(std::move(rings)) {}

bool LandPolygonSet::Contains(const Point& p) const {
  for (const auto& r : rings_) {
    if (!InBBox(r.bbox, p)) continue;
    if (PointInRing(p, r.vertices)) return true;
  }
  return false;
}

bool PointInRing(const Point& p, const std::vector<Point>& ring) {
  const std::size_t n = ring.size();
  if (n < 3) return false;

  const double x = p.lng_deg;
  const double y = p.lat_deg;
  bool inside = false;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const double xi = ring[i].lng_deg, yi = ring[i].lat_deg;
    const double xj = ring[j].lng_deg, yj = ring[j].lat_deg;
    if (((yi > y) != (yj > y)) && (x < (xj - xi) * (y - yi) / (yj - yi) + xi)) {
      inside = !inside;
    }
  }
  return inside;
}

LandPolygonSet ParseLandGeoJson(const json& doc) {
  if (!doc.is_object()) throw std::runtime_error("GeoJSON root is not an object");

  std::vector<LandRing> rings;
  const std::string type = doc.value("type", "");
  if (type == "FeatureCollection") {
    const json& features = doc.at("features");
    if (!features.is_array()) throw std::runtime_error("GeoJSON features is not an array");
    for (const auto& f : features) {
      if (!f.is_object() || !f.contains("geometry")) continue;
      AppendGeometry(f["geometry"], rings);
    }
  } else if (type == "Feature") {
    if (doc.contains("geometry")) AppendGeometry(doc["geometry"], rings);
  } else if (type == "Polygon" || type == "MultiPolygon" || type == "GeometryCollection") {
    AppendGeometry(doc, rings);
  } else {
    throw std::runtime_error("unsupported GeoJSON type: '" + type + "'");
  }
  return LandPolygonSet(std::move(rings));
}

LandLoadResult LoadLandPolygons(const LandMaskConfig& cfg, net::IHttpClient* http) {
  LandLoadResult out;
  std::string err;

  // 1) 本地打包的数据集
  if (!cfg.local_path.empty()) {
    std::ifstream ifs(cfg.local_path, std::ios::in | std::ios::binary);
    if (!ifs) {
      err = "local dataset not found: " + cfg.local_path;
      std::cerr << "[landmask] " << err << "\n";
    } else {
      json doc = json::parse(ifs, nullptr, /*allow_exceptions=*/false);
      if (doc.is_discarded()) {
        err = "local dataset is not valid JSON: " + cfg.local_path;
        std::cerr << "[landmask] " << err << "\n";
      } else if (auto set = TryParse(doc, cfg.local_path, &err)) {
        out.status = LandDataStatus::kLoaded;
        out.polygons = std::move(set);
        out.source = "local:" + cfg.local_path;
        return out;
      } else {
        std::cerr << "[landmask] " << err << "\n";
      }
    }
  }

  // 2) 远程回退
  if (!cfg.remote_url.empty() && http != nullptr) {
    const net::HttpResponse resp = http->Get(cfg.remote_url, cfg.timeout_s);
    if (!resp.ok()) {
      err = "remote dataset fetch failed (" +
            (resp.error.empty() ? "HTTP " + std::to_string(resp.status) : resp.error) + ")";
      std::cerr << "[landmask] " << err << "\n";
    } else {
      json doc = json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
      if (doc.is_discarded()) {
        err = "remote dataset is not valid JSON: " + cfg.remote_url;
        std::cerr << "[landmask] " << err << "\n";
      } else if (auto set = TryParse(doc, cfg.remote_url, &err)) {
        out.status = LandDataStatus::kLoaded;
        out.polygons = std::move(set);
        out.source = "remote:" + cfg.remote_url;
        return out;
      } else {
        std::cerr << "[landmask] " << err << "\n";
      }
    }
  }

  if (err.empty()) err = "no land dataset source configured";
  std::cerr << "[landmask] land mask disabled, every point treated as water\n";
  out.status = LandDataStatus::kUnavailable;
  out.error = err;
  return out;
}

LandMaskProvider& LandMaskProvider::Instance() {
  static LandMaskProvider instance;
  return instance;
}

const LandLoadResult& LandMaskProvider::EnsureReady(const LandMaskConfig& cfg, net::IHttpClient* http) {
  return EnsureReady([&cfg, http]() { return LoadLandPolygons(cfg, http); });
}

const LandLoadResult& LandMaskProvider::EnsureReady(const Loader& loader) {
  std::call_once(once_, [this, &loader]() {
    result_ = loader();
    if (result_.status == LandDataStatus::kLoaded && !result_.polygons) {
      result_.status = LandDataStatus::kUnavailable;
      result_.error = "loader reported success without polygons";
    }
    ready_.store(true, std::memory_order_release);
  });
  return result_;
}

bool LandMaskProvider::IsLand(const Point& p) const {
  if (!loaded()) return false;
  return result_.polygons->Contains(p);
}

bool LandMaskProvider::loaded() const {
  return ready_.load(std::memory_order_acquire) && result_.status == LandDataStatus::kLoaded;
}

std::string LandMaskProvider::source() const {
  if (!ready_.load(std::memory_order_acquire)) return {};
  return result_.source;
}

} // namespace searoute
