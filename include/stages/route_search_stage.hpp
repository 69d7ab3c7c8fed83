#pragma once
#include "landmask/land_mask.hpp"
#include "stages/stage_base.hpp"

namespace searoute {

// ======================
// 环节：航路搜索（A*）
// 流程位置：天气 -> 航路搜索 -> 指标输出
//
// 输入：
//   ctx.request（起终点 + 优化模式）
//   ctx.weather
//   ctx.debug.land_mask_loaded（未加载时不做陆地过滤）
//
// 输出：
//   ctx.result.points：origin -> destination
//   ctx.search：诊断量
//
// 搜索失败（frontier 耗尽 / 达到扩展上限）时退化为 [origin, destination] 直线。
// ======================
class RouteSearchStage final : public IStage {
public:
  explicit RouteSearchStage(const ILandMask* land_mask);
  void Run(RouteContext& ctx) override;

private:
  const ILandMask* land_mask_;
};

} // namespace searoute
