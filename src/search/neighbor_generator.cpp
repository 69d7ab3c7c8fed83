#include "search/neighbor_generator.hpp"

#include <algorithm>
#include <cmath>

#include "geo/geodesic.hpp"

namespace searoute {

StepPlan PlanSteps(double total_trip_nm, const SearchConfig& cfg) {
  const int base = std::max(1, cfg.base_resolution);
  const int cap = std::max(base, cfg.max_steps);

  const double raw = std::ceil(total_trip_nm / 50.0 * static_cast<double>(base));
  StepPlan plan;
  plan.steps = static_cast<int>(std::clamp(raw, static_cast<double>(base), static_cast<double>(cap)));
  plan.step_nm = std::max(cfg.min_step_nm, total_trip_nm / static_cast<double>(plan.steps));
  return plan;
}

NeighborGenerator::NeighborGenerator(const ILandMask* land_mask, double step_nm)
    : land_mask_(land_mask), step_nm_(step_nm) {}

std::vector<Point> NeighborGenerator::Expand(const Point& from) const {
  std::vector<Point> out;
  out.reserve(kBearingCount);
  for (int i = 0; i < kBearingCount; ++i) {
    const double bearing = kBearingStepDeg * static_cast<double>(i);
    const Point p = geo::DestinationPoint(from, bearing, step_nm_);
    if (land_mask_ != nullptr && land_mask_->IsLand(p)) continue;
    out.push_back(p);
  }
  return out;
}

} // namespace searoute
