#include "stages/route_search_stage.hpp"

#include <iostream>
#include <utility>

#include "search/route_search.hpp"
#include "weather/weather_sampler.hpp"

namespace searoute {

RouteSearchStage::RouteSearchStage(const ILandMask* land_mask) : land_mask_(land_mask) {}

void RouteSearchStage::Run(RouteContext& ctx) {
  const WeatherSampler sampler(ctx.weather ? &*ctx.weather : nullptr);

  RouteSearcher::Dependencies deps;
  deps.land_mask = ctx.debug.land_mask_loaded ? land_mask_ : nullptr;
  deps.weather = &sampler;

  const RouteSearcher searcher(deps, ctx.config.search, ctx.config.vessel);
  SearchOutcome outcome = searcher.Search(ctx.request.origin, ctx.request.destination, ctx.request.mode);

  ctx.search = outcome.diag;
  if (outcome.reached) {
    ctx.result.points = std::move(outcome.path);
    return;
  }

  // 搜索失败不报错：退化为起终点直线
  std::cerr << "[route] search exhausted after " << outcome.diag.expansions
            << " expansions, using direct path\n";
  ctx.result.points = {ctx.request.origin, ctx.request.destination};
}

} // namespace searoute
