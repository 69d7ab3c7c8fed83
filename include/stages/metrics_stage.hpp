#pragma once
#include "stages/stage_base.hpp"

namespace searoute {

// ======================
// 环节：航程指标
// 流程位置：航路搜索 -> 指标 -> 输出（output.json / route.csv）
//
// 输入：
//   ctx.result.points
//   ctx.config.vessel（航速 / 油耗率）
//   ctx.weather（逐段海况、危险标签）
//
// 输出：
//   ctx.result.distance_nm / time_hours / fuel_mt
//   ctx.result.legs / route_type / weather_warnings / safety_score
// ======================
class MetricsStage final : public IStage {
public:
  void Run(RouteContext& ctx) override;
};

// 按总航程分类：coastal < 100 <= regional < 1000 <= oceanic < 3000 <= transoceanic
const char* ClassifyRoute(double distance_nm);

} // namespace searoute
