#pragma once
#include <vector>

#include "common/types.hpp"
#include "landmask/land_mask.hpp"

namespace searoute {

// 步长规划：
//   steps   = clamp(ceil(D / 50 * base_resolution), base_resolution, max_steps)
//   step_nm = max(min_step_nm, D / steps)
// 长航程步长粗、短航程步长细。
struct StepPlan {
  int steps{0};
  double step_nm{0.0};
};

StepPlan PlanSteps(double total_trip_nm, const SearchConfig& cfg);

class NeighborGenerator {
public:
  static constexpr int kBearingCount = 16;
  static constexpr double kBearingStepDeg = 360.0 / kBearingCount;  // 22.5

  // land_mask 为空指针时不做陆地过滤
  NeighborGenerator(const ILandMask* land_mask, double step_nm);

  // 按 0, 22.5, ..., 337.5 度顺序生成，落在陆地上的候选直接丢弃
  std::vector<Point> Expand(const Point& from) const;

  double step_nm() const { return step_nm_; }

private:
  const ILandMask* land_mask_;
  double step_nm_;
};

} // namespace searoute
