#pragma once
#include "net/http_client.hpp"
#include "stages/stage_base.hpp"

namespace searoute {

// ======================
// 环节：海况预报
// 流程位置：陆地掩膜 -> 天气 -> 航路搜索
//
// 输入：
//   ctx.request.origin / destination（决定包围盒）
//   ctx.config.weather
//
// 输出：
//   ctx.weather：预报场；拿不到时为 nullopt（搜索按 0 风险处理）
//   ctx.debug.weather_sampled
// ======================
class WeatherStage final : public IStage {
public:
  explicit WeatherStage(net::IHttpClient* http);
  void Run(RouteContext& ctx) override;

private:
  net::IHttpClient* http_;
};

} // namespace searoute
