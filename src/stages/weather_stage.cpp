#include "stages/weather_stage.hpp"

#include "geo/geodesic.hpp"
#include "weather/weather_sampler.hpp"

namespace searoute {

WeatherStage::WeatherStage(net::IHttpClient* http) : http_(http) {}

void WeatherStage::Run(RouteContext& ctx) {
  ctx.weather.reset();

  const WeatherConfig& cfg = ctx.config.weather;
  if (cfg.enabled) {
    if (!cfg.local_path.empty()) {
      ctx.weather = LoadForecastFile(cfg.local_path);
    } else {
      const BBox bbox = geo::TripBBox(ctx.request.origin, ctx.request.destination);
      ctx.weather = FetchForecast(cfg, bbox, http_);
    }
  }

  ctx.debug.weather_sampled = ctx.weather.has_value();
}

} // namespace searoute
