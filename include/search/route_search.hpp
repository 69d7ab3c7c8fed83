#pragma once
#include <vector>

#include "common/types.hpp"
#include "landmask/land_mask.hpp"
#include "weather/weather_sampler.hpp"

namespace searoute {

struct SearchOutcome {
  bool reached{false};
  std::vector<Point> path;   // reached 时 origin -> destination；否则为空
  double cost{0.0};          // path 的累计代价（与搜索里的 g 同一口径）
  SearchDiagnostics diag;
};

// visited key 的小数位数：配置固定值优先；否则让一个 key 格子约等于 step / key_cells_per_step
int KeyDecimalsForStep(double step_nm, const SearchConfig& cfg);

// ======================
// A* 海上航路搜索
//
// 搜索空间是连续的：节点由 NeighborGenerator 在当前位置周围按 16 个方位动态生成，
// 用量化 key 去重。出堆时与 visited 表核对 g，被更便宜路径取代的旧节点直接丢弃。
// 目的地在一步之内时把目的地本身也作为候选（不做陆地判断，港口可能落在陆地多边形里）。
// ======================
class RouteSearcher {
public:
  struct Dependencies {
    const ILandMask* land_mask = nullptr;      // 空 = 不做陆地过滤
    const WeatherSampler* weather = nullptr;   // 空 = 风险恒为 0
  };

  RouteSearcher(Dependencies deps, SearchConfig search, VesselConfig vessel);

  SearchOutcome Search(const Point& origin, const Point& destination, OptimizationMode mode) const;

private:
  Dependencies deps_;
  SearchConfig search_;
  VesselConfig vessel_;
};

} // namespace searoute
