#include "search/route_search.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "geo/geodesic.hpp"
#include "search/cost_model.hpp"
#include "search/frontier.hpp"
#include "search/neighbor_generator.hpp"
#include "search/visited_table.hpp"

namespace searoute {

namespace {

// 小于这个长度的航段视为退化，不扩展
constexpr double kMinSegmentNm = 1e-4;
// 路径末点与目的地距离小于它就认为是同一点，不再补目的地
constexpr double kSamePointNm = 1e-9;
constexpr std::size_t kNoParent = static_cast<std::size_t>(-1);

// 每次成功 Improve 追加一条，之后不再修改；节点的 g 与它的前驱链始终一致
struct Trail {
  Point point;
  std::size_t parent{kNoParent};
};

std::vector<Point> Reconstruct(const std::vector<Trail>& trails, std::size_t last) {
  std::vector<Point> path;
  for (std::size_t i = last; i != kNoParent; i = trails[i].parent) {
    path.push_back(trails[i].point);
    if (path.size() > trails.size()) {
      throw std::runtime_error("route reconstruction: predecessor chain does not terminate");
    }
  }
  std::reverse(path.begin(), path.end());
  return path;
}

} // namespace

int KeyDecimalsForStep(double step_nm, const SearchConfig& cfg) {
  if (cfg.key_decimals >= 0) return cfg.key_decimals;

  // 纬度 1 度约 60 nm
  const double cell_deg = step_nm / 60.0 / std::max(1.0, cfg.key_cells_per_step);
  if (!(cell_deg > 0.0)) return cfg.max_key_decimals;
  const long d = std::lround(-std::log10(cell_deg));
  return static_cast<int>(std::clamp<long>(d, 0, cfg.max_key_decimals));
}

RouteSearcher::RouteSearcher(Dependencies deps, SearchConfig search, VesselConfig vessel)
    : deps_(deps), search_(search), vessel_(vessel) {
  if (!(vessel_.speed_kts > 0.0)) {
    throw std::invalid_argument("vessel speed must be positive");
  }
}

SearchOutcome RouteSearcher::Search(const Point& origin,
                                    const Point& destination,
                                    OptimizationMode mode) const {
  SearchOutcome out;

  const CostWeights w = WeightsFor(mode);
  const double total_nm = geo::DistanceNm(origin, destination);
  const StepPlan plan = PlanSteps(total_nm, search_);
  const int decimals = KeyDecimalsForStep(plan.step_nm, search_);
  out.diag.step_nm = plan.step_nm;
  out.diag.key_decimals = decimals;

  const NeighborGenerator neighbors(deps_.land_mask, plan.step_nm);
  const WeatherSampler no_weather;
  const WeatherSampler& weather = (deps_.weather != nullptr) ? *deps_.weather : no_weather;

  VisitedTable visited;
  std::vector<Trail> trails;
  Frontier open;
  // 目的地所在的 key 格子：走进这个格子也算到达（格子里先到的点可能比目的地本身更便宜）
  const std::string goal_key = QuantizedKey(destination, decimals);

  // 初始状态：起点 g=0, t=0
  SearchNode start;
  start.point = origin;
  start.key = QuantizedKey(origin, decimals);
  start.h = Heuristic(origin, destination, w);
  start.f = start.h;
  start.trail = trails.size();
  trails.push_back({origin, kNoParent});
  visited.Improve(start.key, {0.0, start.trail});
  open.Push(start);

  while (!open.empty()) {
    const SearchNode cur = open.Pop();

    // 同一位置之后又找到了更便宜的路径：这是旧节点，丢弃
    if (!visited.IsCurrent(cur.key, cur.g)) {
      ++out.diag.stale_discarded;
      continue;
    }

    const double to_goal = geo::DistanceNm(cur.point, destination);
    if (to_goal < search_.reach_threshold_nm || cur.key == goal_key) {
      out.reached = true;
      out.diag.reached = true;
      out.path = Reconstruct(trails, cur.trail);
      out.cost = cur.g;
      // 阈值内提前到达：补上最后一段，代价按同一模型计入
      const double tail_nm = geo::DistanceNm(out.path.back(), destination);
      if (tail_nm > kSamePointNm) {
        const double eta = cur.elapsed_hours + tail_nm / vessel_.speed_kts;
        out.cost += SegmentCost(tail_nm, weather.Risk(destination, eta), w);
        out.path.push_back(destination);
      }
      return out;
    }

    if (out.diag.expansions >= search_.max_expansions) {
      std::cerr << "[route] expansion limit (" << search_.max_expansions
                << ") hit before reaching destination\n";
      break;
    }
    ++out.diag.expansions;

    std::vector<Point> candidates = neighbors.Expand(cur.point);
    if (to_goal <= plan.step_nm) candidates.push_back(destination);

    for (const auto& np : candidates) {
      const double seg_nm = geo::DistanceNm(cur.point, np);
      if (seg_nm < kMinSegmentNm) continue;

      // 航速暂不受海况影响，天气只体现在代价里
      const double eta = cur.elapsed_hours + seg_nm / vessel_.speed_kts;
      const double risk = weather.Risk(np, eta);
      const double g2 = cur.g + SegmentCost(seg_nm, risk, w);

      std::string nk = QuantizedKey(np, decimals);
      if (!visited.Improve(nk, {g2, trails.size()})) continue;
      trails.push_back({np, cur.trail});

      SearchNode next;
      next.point = np;
      next.key = std::move(nk);
      next.g = g2;
      next.h = Heuristic(np, destination, w);
      next.f = g2 + next.h;
      next.trail = trails.size() - 1;
      next.elapsed_hours = eta;
      open.Push(std::move(next));
    }
  }

  out.reached = false;
  out.diag.reached = false;
  out.path.clear();
  out.cost = 0.0;
  return out;
}

} // namespace searoute
