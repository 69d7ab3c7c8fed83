#include "stages/metrics_stage.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include "geo/geodesic.hpp"
#include "weather/weather_sampler.hpp"

namespace searoute {

namespace {

// =========================
// 指标约定
// =========================
// 1) 距离：逐段大圆距离累加。
// 2) 时间：总距离 / 固定航速（vessel.speed_kts），不考虑海况降速。
// 3) 油耗：时间 * 固定油耗率（vessel.fuel_tph，单位 t/h）。
// 4) 逐段海况：取到达该段终点时刻（eta）、离终点最近的预报点位。
//    浪高 > 6 m 标 "High waves"，> 4 m 标 "Rough seas"。
// 5) 安全分：100 起，每个危险标签扣 5 分，最低 0。
//
constexpr double kHighWavesM = 6.0;
constexpr double kRoughSeasM = 4.0;
constexpr double kHazardPenalty = 5.0;

std::vector<std::string> LegHazards(const WeatherSample& s) {
  std::vector<std::string> out;
  if (s.wave_height_m > kHighWavesM) {
    out.emplace_back("High waves");
  } else if (s.wave_height_m > kRoughSeasM) {
    out.emplace_back("Rough seas");
  }
  return out;
}

} // namespace

const char* ClassifyRoute(double distance_nm) {
  if (distance_nm < 100.0) return "coastal";
  if (distance_nm < 1000.0) return "regional";
  if (distance_nm < 3000.0) return "oceanic";
  return "transoceanic";
}

void MetricsStage::Run(RouteContext& ctx) {
  RouteResult& r = ctx.result;
  if (r.points.empty()) {
    throw std::runtime_error("MetricsStage: route has no points");
  }

  r.legs.clear();
  r.weather_warnings.clear();

  const double speed = ctx.config.vessel.speed_kts;
  const WeatherSampler sampler(ctx.weather ? &*ctx.weather : nullptr);

  double total_nm = 0.0;
  double elapsed_h = 0.0;
  std::size_t hazard_count = 0;
  std::set<std::string> warnings;

  r.legs.reserve(r.points.size() > 1 ? r.points.size() - 1 : 0);
  for (std::size_t i = 0; i + 1 < r.points.size(); ++i) {
    RouteLeg leg;
    leg.from = r.points[i];
    leg.to = r.points[i + 1];
    leg.distance_nm = geo::DistanceNm(leg.from, leg.to);
    leg.hours = leg.distance_nm / speed;
    elapsed_h += leg.hours;
    leg.eta_hours = elapsed_h;

    if (sampler.available()) {
      leg.sea_state = sampler.Sample(leg.to, elapsed_h);
      leg.risk = NormalizedRisk(leg.sea_state);
      leg.hazards = LegHazards(leg.sea_state);
    }
    hazard_count += leg.hazards.size();
    warnings.insert(leg.hazards.begin(), leg.hazards.end());

    total_nm += leg.distance_nm;
    r.legs.push_back(std::move(leg));
  }

  r.distance_nm = total_nm;
  r.time_hours = total_nm / speed;
  r.fuel_mt = r.time_hours * ctx.config.vessel.fuel_tph;
  r.route_type = ClassifyRoute(total_nm);
  r.weather_warnings.assign(warnings.begin(), warnings.end());
  r.safety_score = std::max(0.0, 100.0 - kHazardPenalty * static_cast<double>(hazard_count));
}

} // namespace searoute
