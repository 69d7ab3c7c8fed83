#include "weather/weather_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

#include "geo/geodesic.hpp"

namespace searoute {

namespace {

using json = nlohmann::json;

inline double Clamp01(double v) {
  if (!(v > 0.0)) return 0.0;   // 也吞掉 NaN
  return (v > 1.0) ? 1.0 : v;
}

// 预报数组里可能有 null（陆地格点 / 缺测），按 0 处理
double NumberOr0(const json& arr, std::size_t i) {
  if (!arr.is_array() || i >= arr.size() || !arr[i].is_number()) return 0.0;
  return arr[i].get<double>();
}

std::optional<WeatherStation> ParseLocation(const json& loc) {
  if (!loc.is_object()) return std::nullopt;
  const json hourly = loc.value("hourly", json::object());
  if (!hourly.is_object()) return std::nullopt;

  const json time = hourly.value("time", json::array());
  const json wave = hourly.value("wave_height", json::array());
  const json wind_wave = hourly.value("wind_wave_height", json::array());

  std::size_t n = time.is_array() ? time.size() : 0;
  if (n == 0) {
    n = std::max(wave.is_array() ? wave.size() : 0, wind_wave.is_array() ? wind_wave.size() : 0);
  }
  if (n == 0) return std::nullopt;

  WeatherStation st;
  // 单点位时 latitude/longitude 缺失也无所谓（最近点位只有它一个）
  if (loc.contains("latitude") && loc["latitude"].is_number()) {
    st.location.lat_deg = loc["latitude"].get<double>();
  }
  if (loc.contains("longitude") && loc["longitude"].is_number()) {
    st.location.lng_deg = geo::NormalizeLng(loc["longitude"].get<double>());
  }
  st.series.hourly.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    st.series.hourly.push_back({NumberOr0(wave, i), NumberOr0(wind_wave, i)});
  }
  return st;
}

std::vector<double> GridAxis(double lo, double hi, int n) {
  std::vector<double> out;
  if (n <= 1) {
    out.push_back(0.5 * (lo + hi));
    return out;
  }
  out.reserve(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    out.push_back(lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(n - 1));
  }
  return out;
}

} // namespace

double NormalizedRisk(const WeatherSample& s) {
  const double w = Clamp01(s.wave_height_m / kMaxWaveM);
  const double ww = Clamp01(s.wind_wave_height_m / kMaxWindWaveM);
  return kWaveRiskWeight * w + kWindWaveRiskWeight * ww;
}

WeatherSample SampleSeries(const WeatherSeries& series, double elapsed_hours) {
  if (series.hourly.empty()) return {};
  const double last = static_cast<double>(series.hourly.size() - 1);
  double idx = std::round(elapsed_hours);
  if (!(idx > 0.0)) idx = 0.0;
  if (idx > last) idx = last;
  return series.hourly[static_cast<std::size_t>(idx)];
}

std::string BuildForecastUrl(const WeatherConfig& cfg, const BBox& bbox) {
  const std::vector<double> lats = GridAxis(bbox.min_lat, bbox.max_lat, cfg.grid_size);
  const std::vector<double> lngs = GridAxis(bbox.min_lng, bbox.max_lng, cfg.grid_size);

  std::ostringstream lat_list;
  std::ostringstream lng_list;
  lat_list << std::fixed << std::setprecision(4);
  lng_list << std::fixed << std::setprecision(4);
  bool first = true;
  for (double lat : lats) {
    for (double lng : lngs) {
      if (!first) {
        lat_list << ",";
        lng_list << ",";
      }
      first = false;
      lat_list << lat;
      lng_list << lng;
    }
  }

  std::ostringstream url;
  url << cfg.base_url
      << "?latitude=" << lat_list.str()
      << "&longitude=" << lng_list.str()
      << "&hourly=wave_height,wind_wave_height"
      << "&forecast_days=" << cfg.forecast_days;
  return url.str();
}

std::optional<WeatherField> ParseForecast(const json& doc) {
  WeatherField field;
  if (doc.is_array()) {
    for (const auto& loc : doc) {
      if (auto st = ParseLocation(loc)) field.stations.push_back(std::move(*st));
    }
  } else if (auto st = ParseLocation(doc)) {
    field.stations.push_back(std::move(*st));
  }
  if (field.stations.empty()) return std::nullopt;
  return field;
}

std::optional<WeatherField> FetchForecast(const WeatherConfig& cfg,
                                          const BBox& bbox,
                                          net::IHttpClient* http) {
  if (http == nullptr) return std::nullopt;

  const std::string url = BuildForecastUrl(cfg, bbox);
  const net::HttpResponse resp = http->Get(url, cfg.timeout_s);
  if (!resp.ok()) {
    std::cerr << "[weather] forecast unavailable ("
              << (resp.error.empty() ? "HTTP " + std::to_string(resp.status) : resp.error)
              << "), sea-state risk set to 0\n";
    return std::nullopt;
  }

  const json doc = json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    std::cerr << "[weather] forecast payload is not valid JSON, sea-state risk set to 0\n";
    return std::nullopt;
  }
  auto field = ParseForecast(doc);
  if (!field) {
    std::cerr << "[weather] forecast payload has no hourly series, sea-state risk set to 0\n";
  }
  return field;
}

std::optional<WeatherField> LoadForecastFile(const std::string& path) {
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs) {
    std::cerr << "[weather] forecast file not found: " << path << "\n";
    return std::nullopt;
  }
  const json doc = json::parse(ifs, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    std::cerr << "[weather] forecast file is not valid JSON: " << path << "\n";
    return std::nullopt;
  }
  return ParseForecast(doc);
}

WeatherSampler::WeatherSampler(const WeatherField* field) : field_(field) {}

const WeatherStation* WeatherSampler::Nearest(const Point& p) const {
  if (!available()) return nullptr;
  if (field_->stations.size() == 1) return &field_->stations.front();

  const WeatherStation* best = nullptr;
  double best_d = std::numeric_limits<double>::infinity();
  for (const auto& st : field_->stations) {
    const double d = geo::DistanceNm(p, st.location);
    // 严格小于：距离相同取先出现的点位，保证结果确定
    if (d < best_d) {
      best_d = d;
      best = &st;
    }
  }
  return best;
}

WeatherSample WeatherSampler::Sample(const Point& p, double elapsed_hours) const {
  const WeatherStation* st = Nearest(p);
  if (st == nullptr) return {};
  return SampleSeries(st->series, elapsed_hours);
}

double WeatherSampler::Risk(const Point& p, double elapsed_hours) const {
  if (!available()) return 0.0;
  return NormalizedRisk(Sample(p, elapsed_hours));
}

} // namespace searoute
