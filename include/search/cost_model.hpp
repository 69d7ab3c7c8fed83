#pragma once
#include <optional>
#include <string>

#include "common/types.hpp"

namespace searoute {

// 优化模式 -> (距离权重, 天气权重)，固定映射
//   time    : 1.0 / 0.8
//   fuel    : 1.2 / 0.6
//   weather : 0.75 / 1.5
CostWeights WeightsFor(OptimizationMode mode);

const char* ModeName(OptimizationMode mode);
std::optional<OptimizationMode> ParseMode(const std::string& name);

// 航段代价：距离权重 * 航段长度 + 天气权重 * 风险（风险 ∈ [0,1]，与航段长度无关）
inline double SegmentCost(double distance_nm, double risk, const CostWeights& w) {
  return w.distance * distance_nm + w.weather * risk;
}

// 启发式只用大圆距离，不含天气项。天气项 >= 0，所以不会高估剩余代价（可采纳）。
double Heuristic(const Point& p, const Point& destination, const CostWeights& w);

} // namespace searoute
