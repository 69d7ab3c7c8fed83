#include "pipeline/pipeline.hpp"

// 具体 Stage
#include "stages/land_mask_stage.hpp"
#include "stages/metrics_stage.hpp"
#include "stages/route_search_stage.hpp"
#include "stages/weather_stage.hpp"

namespace searoute {

Pipeline::Pipeline(Dependencies deps) {
  stages_.emplace_back(std::make_unique<LandMaskStage>(deps.land_mask, deps.http));
  stages_.emplace_back(std::make_unique<WeatherStage>(deps.http));
  stages_.emplace_back(std::make_unique<RouteSearchStage>(deps.land_mask));
  stages_.emplace_back(std::make_unique<MetricsStage>());
}

void Pipeline::Run(RouteContext& ctx) {
  for (auto& stage : stages_) {
    stage->Run(ctx);
  }
}

} // namespace searoute
