#include "tests/test_framework.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "geo/geodesic.hpp"
#include "search/cost_model.hpp"
#include "search/frontier.hpp"
#include "search/neighbor_generator.hpp"
#include "search/route_search.hpp"
#include "search/visited_table.hpp"

// =========================
// A* 搜索：步长 / 邻居 / 堆 / visited 表 / 端到端性质
// =========================
//
// 场景统一用赤道上 (0,0) -> (0,1)，约 60 nm：
//   step = 60.04 / 19 ≈ 3.16 nm，key 精度 2 位小数（约 0.6 nm 一格）
//

namespace {

using searoute::ILandMask;
using searoute::OptimizationMode;
using searoute::Point;
using searoute::RouteSearcher;
using searoute::SearchConfig;
using searoute::SearchOutcome;
using searoute::VesselConfig;
using searoute::WeatherField;
using searoute::WeatherSample;
using searoute::WeatherSampler;
using searoute::WeatherStation;
namespace geo = searoute::geo;

const Point kOrigin{0.0, 0.0};
const Point kDestination{0.0, 1.0};

// lng ∈ [0.45, 0.55] 且 |lat| <= 0.3 的一道“墙”
class WallMask final : public ILandMask {
public:
  bool IsLand(const Point& p) const override {
    return p.lng_deg >= 0.45 && p.lng_deg <= 0.55 && std::fabs(p.lat_deg) <= 0.3;
  }
};

// 除起点附近 0.5 nm 以外全是陆地：起点被困住
class TrappedMask final : public ILandMask {
public:
  explicit TrappedMask(Point origin) : origin_(origin) {}
  bool IsLand(const Point& p) const override { return geo::DistanceNm(p, origin_) > 0.5; }

private:
  Point origin_;
};

WeatherStation Constant(Point at, double wave, double wind_wave) {
  WeatherStation st;
  st.location = at;
  st.series.hourly.assign(48, WeatherSample{wave, wind_wave});
  return st;
}

// 航线中段 (0, 0.5) 是风暴（风险 1），其它点位平静。
// 最近点位划分后，风暴区大致是 lng ∈ (0.25, 0.75)、|lat| < 0.25 的方块。
WeatherField StormInTheMiddle() {
  WeatherField f;
  f.stations.push_back(Constant({0.0, 0.0}, 0.0, 0.0));
  f.stations.push_back(Constant({0.0, 1.0}, 0.0, 0.0));
  f.stations.push_back(Constant({0.0, 0.5}, 10.0, 8.0));
  f.stations.push_back(Constant({0.5, 0.5}, 0.0, 0.0));
  f.stations.push_back(Constant({-0.5, 0.5}, 0.0, 0.0));
  return f;
}

double PathNm(const std::vector<Point>& path) {
  double d = 0.0;
  for (std::size_t i = 0; i + 1 < path.size(); ++i) d += geo::DistanceNm(path[i], path[i + 1]);
  return d;
}

double MaxAbsLat(const std::vector<Point>& path) {
  double m = 0.0;
  for (const auto& p : path) m = std::max(m, std::fabs(p.lat_deg));
  return m;
}

// 沿路径按搜索同一口径重算代价：逐段累计 eta，风险取段终点
double PathCost(const std::vector<Point>& path, const WeatherSampler& sampler, OptimizationMode mode) {
  const auto w = searoute::WeightsFor(mode);
  const double speed = VesselConfig{}.speed_kts;
  double cost = 0.0;
  double eta = 0.0;
  for (std::size_t i = 0; i + 1 < path.size(); ++i) {
    const double seg = geo::DistanceNm(path[i], path[i + 1]);
    eta = eta + seg / speed;
    cost = cost + searoute::SegmentCost(seg, sampler.Risk(path[i + 1], eta), w);
  }
  return cost;
}

std::size_t StormPoints(const std::vector<Point>& path, const WeatherSampler& sampler) {
  std::size_t n = 0;
  for (const auto& p : path) {
    if (sampler.Risk(p, 0.0) > 0.5) ++n;
  }
  return n;
}

SearchOutcome Run(const ILandMask* mask, const WeatherSampler* weather, OptimizationMode mode,
                  Point origin = kOrigin, Point destination = kDestination,
                  SearchConfig cfg = SearchConfig{}) {
  RouteSearcher::Dependencies deps;
  deps.land_mask = mask;
  deps.weather = weather;
  const RouteSearcher searcher(deps, cfg, VesselConfig{});
  return searcher.Search(origin, destination, mode);
}

// ---------- 步长 / key 精度 ----------

bool Test_PlanSteps() {
  const SearchConfig cfg;
  searoute::StepPlan p = searoute::PlanSteps(100.0, cfg);
  SEAROUTE_EXPECT_EQ(p.steps, 30);
  SEAROUTE_EXPECT_NEAR(p.step_nm, 100.0 / 30.0, 1e-12);

  // 短航程：步数下限 15，步长下限 1 nm
  p = searoute::PlanSteps(10.0, cfg);
  SEAROUTE_EXPECT_EQ(p.steps, 15);
  SEAROUTE_EXPECT_NEAR(p.step_nm, 1.0, 1e-12);

  // 长航程：步数上限 60
  p = searoute::PlanSteps(5000.0, cfg);
  SEAROUTE_EXPECT_EQ(p.steps, 60);
  SEAROUTE_EXPECT_NEAR(p.step_nm, 5000.0 / 60.0, 1e-9);

  p = searoute::PlanSteps(0.0, cfg);
  SEAROUTE_EXPECT_EQ(p.steps, 15);
  SEAROUTE_EXPECT_NEAR(p.step_nm, 1.0, 1e-12);
  return true;
}

bool Test_KeyDecimalsForStep() {
  SearchConfig cfg;
  SEAROUTE_EXPECT_EQ(searoute::KeyDecimalsForStep(60.04 / 19.0, cfg), 2);
  SEAROUTE_EXPECT_EQ(searoute::KeyDecimalsForStep(5000.0 / 60.0, cfg), 1);
  SEAROUTE_EXPECT_EQ(searoute::KeyDecimalsForStep(1.0, cfg), 3);
  // 上限
  SEAROUTE_EXPECT_EQ(searoute::KeyDecimalsForStep(0.01, cfg), 4);
  // 配置固定值优先
  cfg.key_decimals = 5;
  SEAROUTE_EXPECT_EQ(searoute::KeyDecimalsForStep(3.0, cfg), 5);
  return true;
}

// ---------- 邻居 ----------

bool Test_Neighbors_SixteenBearings() {
  const searoute::NeighborGenerator gen(nullptr, 5.0);
  const std::vector<Point> out = gen.Expand({10.0, 20.0});
  SEAROUTE_EXPECT_EQ(out.size(), static_cast<std::size_t>(16));
  for (const auto& p : out) {
    SEAROUTE_EXPECT_NEAR(geo::DistanceNm({10.0, 20.0}, p), 5.0, 1e-6);
  }
  // 第一个是正北
  SEAROUTE_EXPECT_TRUE(out.front().lat_deg > 10.0);
  SEAROUTE_EXPECT_NEAR(out.front().lng_deg, 20.0, 1e-9);
  return true;
}

bool Test_Neighbors_LandFiltered() {
  const WallMask wall;
  // 紧贴墙西侧：东向的几个候选落在墙里
  const searoute::NeighborGenerator gen(&wall, 3.0);
  const std::vector<Point> out = gen.Expand({0.0, 0.42});
  SEAROUTE_EXPECT_TRUE(out.size() < 16);
  for (const auto& p : out) SEAROUTE_EXPECT_TRUE(!wall.IsLand(p));
  return true;
}

// ---------- Frontier / VisitedTable ----------

bool Test_Frontier_OrdersByFThenInsertion() {
  searoute::Frontier open;
  auto node = [](double f, double tag) {
    searoute::SearchNode n;
    n.f = f;
    n.point.lat_deg = tag;
    return n;
  };
  open.Push(node(3.0, 1));
  open.Push(node(1.0, 2));
  open.Push(node(2.0, 3));
  open.Push(node(1.0, 4));
  SEAROUTE_EXPECT_EQ(open.size(), static_cast<std::size_t>(4));

  std::vector<double> order;
  while (!open.empty()) order.push_back(open.Pop().point.lat_deg);
  SEAROUTE_EXPECT_TRUE((order == std::vector<double>{2, 4, 3, 1}));
  return true;
}

bool Test_QuantizedKey() {
  SEAROUTE_EXPECT_EQ(searoute::QuantizedKey({1.23456, 103.98765}, 2), std::string("1.23,103.99"));
  SEAROUTE_EXPECT_EQ(searoute::QuantizedKey({-0.001, 0.0}, 2), std::string("0.00,0.00"));
  SEAROUTE_EXPECT_EQ(searoute::QuantizedKey({51.9244, 4.4777}, 0), std::string("52,4"));
  // 同一格子里的两个点 key 相同
  SEAROUTE_EXPECT_EQ(searoute::QuantizedKey({1.001, 2.002}, 2), searoute::QuantizedKey({0.999, 1.998}, 2));
  return true;
}

bool Test_VisitedTable_ImproveAndStale() {
  searoute::VisitedTable t;
  SEAROUTE_EXPECT_TRUE(!t.IsCurrent("a", 1.0));
  SEAROUTE_EXPECT_TRUE(t.Improve("a", {5.0, 0}));
  // 不更便宜的不写入
  SEAROUTE_EXPECT_TRUE(!t.Improve("a", {5.0, 1}));
  SEAROUTE_EXPECT_TRUE(!t.Improve("a", {7.0, 1}));
  SEAROUTE_EXPECT_TRUE(t.IsCurrent("a", 5.0));

  SEAROUTE_EXPECT_TRUE(t.Improve("a", {3.0, 2}));
  // g=5 的旧节点出堆时应被判为 stale
  SEAROUTE_EXPECT_TRUE(!t.IsCurrent("a", 5.0));
  SEAROUTE_EXPECT_TRUE(t.IsCurrent("a", 3.0));
  SEAROUTE_EXPECT_EQ(t.Find("a")->trail, static_cast<std::size_t>(2));
  SEAROUTE_EXPECT_EQ(t.size(), static_cast<std::size_t>(1));
  return true;
}

// ---------- 代价模型 ----------

bool Test_CostModel_WeightsAndModes() {
  const auto t = searoute::WeightsFor(OptimizationMode::kTime);
  const auto f = searoute::WeightsFor(OptimizationMode::kFuel);
  const auto w = searoute::WeightsFor(OptimizationMode::kWeather);
  SEAROUTE_EXPECT_NEAR(t.distance, 1.0, 0.0);
  SEAROUTE_EXPECT_NEAR(t.weather, 0.8, 0.0);
  SEAROUTE_EXPECT_NEAR(f.distance, 1.2, 0.0);
  SEAROUTE_EXPECT_NEAR(f.weather, 0.6, 0.0);
  SEAROUTE_EXPECT_NEAR(w.distance, 0.75, 0.0);
  SEAROUTE_EXPECT_NEAR(w.weather, 1.5, 0.0);

  SEAROUTE_EXPECT_NEAR(searoute::SegmentCost(10.0, 0.5, w), 0.75 * 10.0 + 1.5 * 0.5, 1e-12);

  SEAROUTE_EXPECT_TRUE(searoute::ParseMode("fuel") == OptimizationMode::kFuel);
  SEAROUTE_EXPECT_TRUE(!searoute::ParseMode("fastest").has_value());
  SEAROUTE_EXPECT_EQ(std::string(searoute::ModeName(OptimizationMode::kWeather)), std::string("weather"));
  return true;
}

bool Test_Heuristic_NeverExceedsDirectCost() {
  const Point probes[] = {{0.0, 0.0}, {10.0, 50.0}, {-33.9, 18.4}, {60.0, -170.0}};
  for (auto mode : {OptimizationMode::kTime, OptimizationMode::kFuel, OptimizationMode::kWeather}) {
    const auto w = searoute::WeightsFor(mode);
    for (const auto& a : probes) {
      for (const auto& b : probes) {
        // 即使零风险直达，代价也不小于启发式
        const double direct = searoute::SegmentCost(geo::DistanceNm(a, b), 0.0, w);
        SEAROUTE_EXPECT_TRUE(searoute::Heuristic(a, b, w) <= direct + 1e-9);
      }
    }
  }
  return true;
}

// ---------- 端到端 ----------

bool Test_Search_OpenWaterReachesExactDestination() {
  const SearchOutcome out = Run(nullptr, nullptr, OptimizationMode::kTime);
  SEAROUTE_EXPECT_TRUE(out.reached);
  SEAROUTE_EXPECT_TRUE(out.diag.reached);
  SEAROUTE_EXPECT_TRUE(out.path.size() >= 2);
  SEAROUTE_EXPECT_NEAR(out.path.front().lat_deg, kOrigin.lat_deg, 0.0);
  SEAROUTE_EXPECT_NEAR(out.path.front().lng_deg, kOrigin.lng_deg, 0.0);
  SEAROUTE_EXPECT_NEAR(out.path.back().lat_deg, kDestination.lat_deg, 0.0);
  SEAROUTE_EXPECT_NEAR(out.path.back().lng_deg, kDestination.lng_deg, 0.0);

  const double direct = geo::DistanceNm(kOrigin, kDestination);
  SEAROUTE_EXPECT_TRUE(PathNm(out.path) >= direct - 1e-9);
  // 开阔水域：接近大圆
  SEAROUTE_EXPECT_TRUE(PathNm(out.path) < direct * 1.1);
  SEAROUTE_EXPECT_EQ(out.diag.key_decimals, 2);
  SEAROUTE_EXPECT_TRUE(out.diag.expansions > 0);
  return true;
}

bool Test_Search_Deterministic() {
  const WeatherField field = StormInTheMiddle();
  const WeatherSampler sampler(&field);
  const WallMask wall;
  const SearchOutcome a = Run(&wall, &sampler, OptimizationMode::kWeather);
  const SearchOutcome b = Run(&wall, &sampler, OptimizationMode::kWeather);
  SEAROUTE_EXPECT_EQ(a.path.size(), b.path.size());
  for (std::size_t i = 0; i < a.path.size(); ++i) {
    SEAROUTE_EXPECT_TRUE(a.path[i].lat_deg == b.path[i].lat_deg);
    SEAROUTE_EXPECT_TRUE(a.path[i].lng_deg == b.path[i].lng_deg);
  }
  SEAROUTE_EXPECT_EQ(a.diag.expansions, b.diag.expansions);
  return true;
}

bool Test_Search_AvoidsLandWall() {
  const WallMask wall;
  const SearchOutcome out = Run(&wall, nullptr, OptimizationMode::kTime);
  SEAROUTE_EXPECT_TRUE(out.reached);
  for (std::size_t i = 1; i + 1 < out.path.size(); ++i) {
    SEAROUTE_EXPECT_TRUE(!wall.IsLand(out.path[i]));
  }
  // 必须绕过墙的南端或北端
  SEAROUTE_EXPECT_TRUE(MaxAbsLat(out.path) > 0.3);
  SEAROUTE_EXPECT_TRUE(PathNm(out.path) > geo::DistanceNm(kOrigin, kDestination) + 5.0);
  return true;
}

bool Test_Search_WeatherModeDetoursAroundStorm() {
  const WeatherField field = StormInTheMiddle();
  const WeatherSampler sampler(&field);

  const SearchOutcome time = Run(nullptr, &sampler, OptimizationMode::kTime);
  const SearchOutcome weather = Run(nullptr, &sampler, OptimizationMode::kWeather);
  SEAROUTE_EXPECT_TRUE(time.reached);
  SEAROUTE_EXPECT_TRUE(weather.reached);

  // time 模式直穿风暴更便宜；weather 模式绕行
  SEAROUTE_EXPECT_TRUE(PathNm(weather.path) > PathNm(time.path));
  SEAROUTE_EXPECT_TRUE(MaxAbsLat(weather.path) > MaxAbsLat(time.path));
  SEAROUTE_EXPECT_TRUE(StormPoints(weather.path, sampler) < StormPoints(time.path, sampler));
  return true;
}

// 风暴边缘的格子会先被一条较贵的路径写入、出堆前又被更便宜的路径改写，
// 堆里留下的旧节点必须在出堆时丢弃；返回的代价是目的地格子的当前最优 g，
// 且与沿返回路径重算的代价一致
bool Test_Search_SupersededEntriesAreSkipped() {
  const WeatherField field = StormInTheMiddle();
  const WeatherSampler sampler(&field);

  const SearchOutcome out = Run(nullptr, &sampler, OptimizationMode::kWeather);
  SEAROUTE_EXPECT_TRUE(out.reached);
  SEAROUTE_EXPECT_TRUE(out.diag.reached);
  SEAROUTE_EXPECT_TRUE(out.diag.stale_discarded > 0);
  SEAROUTE_EXPECT_NEAR(out.cost, PathCost(out.path, sampler, OptimizationMode::kWeather), 1e-9);

  // 不可能比零风险大圆直达更便宜
  const double direct = searoute::SegmentCost(geo::DistanceNm(kOrigin, kDestination), 0.0,
                                              searoute::WeightsFor(OptimizationMode::kWeather));
  SEAROUTE_EXPECT_TRUE(out.cost >= direct - 1e-9);
  return true;
}

bool Test_Search_CostMatchesPathWithLand() {
  const WeatherField field = StormInTheMiddle();
  const WeatherSampler sampler(&field);
  const WallMask wall;
  for (auto mode : {OptimizationMode::kTime, OptimizationMode::kWeather}) {
    const SearchOutcome out = Run(&wall, &sampler, mode);
    SEAROUTE_EXPECT_TRUE(out.reached);
    SEAROUTE_EXPECT_NEAR(out.cost, PathCost(out.path, sampler, mode), 1e-9);
  }
  return true;
}

bool Test_Search_NoWeatherMeansModesAgreeOnGeometry() {
  // 没有天气时代价只剩距离项（按比例缩放），三种模式路径一致
  const SearchOutcome t = Run(nullptr, nullptr, OptimizationMode::kTime);
  const SearchOutcome w = Run(nullptr, nullptr, OptimizationMode::kWeather);
  SEAROUTE_EXPECT_TRUE(t.reached && w.reached);
  SEAROUTE_EXPECT_NEAR(PathNm(t.path), PathNm(w.path), 1e-6);
  return true;
}

bool Test_Search_SameOriginAndDestination() {
  const SearchOutcome out = Run(nullptr, nullptr, OptimizationMode::kWeather, {1.3, 103.8}, {1.3, 103.8});
  SEAROUTE_EXPECT_TRUE(out.reached);
  SEAROUTE_EXPECT_TRUE(out.diag.reached);
  SEAROUTE_EXPECT_EQ(out.path.size(), static_cast<std::size_t>(1));
  SEAROUTE_EXPECT_NEAR(PathNm(out.path), 0.0, 0.0);
  SEAROUTE_EXPECT_NEAR(out.cost, 0.0, 0.0);
  return true;
}

bool Test_Search_TrappedOriginExhausts() {
  const TrappedMask trapped(kOrigin);
  const SearchOutcome out = Run(&trapped, nullptr, OptimizationMode::kTime);
  SEAROUTE_EXPECT_TRUE(!out.reached);
  SEAROUTE_EXPECT_TRUE(!out.diag.reached);
  SEAROUTE_EXPECT_TRUE(out.path.empty());
  SEAROUTE_EXPECT_EQ(out.diag.expansions, static_cast<std::size_t>(1));
  return true;
}

bool Test_Search_ExpansionLimit() {
  SearchConfig cfg;
  cfg.max_expansions = 3;
  const SearchOutcome out =
      Run(nullptr, nullptr, OptimizationMode::kTime, {0.0, 0.0}, {0.0, 20.0}, cfg);
  SEAROUTE_EXPECT_TRUE(!out.reached);
  SEAROUTE_EXPECT_TRUE(!out.diag.reached);
  SEAROUTE_EXPECT_EQ(out.diag.expansions, static_cast<std::size_t>(3));
  return true;
}

bool Test_Search_CrossesAntimeridian() {
  const Point a{0.0, 179.5};
  const Point b{0.0, -179.5};
  const SearchOutcome out = Run(nullptr, nullptr, OptimizationMode::kTime, a, b);
  SEAROUTE_EXPECT_TRUE(out.reached);
  // 走 1 度的短边，不绕地球一圈
  SEAROUTE_EXPECT_TRUE(PathNm(out.path) < 70.0);
  for (const auto& p : out.path) SEAROUTE_EXPECT_TRUE(p.lng_deg > -180.0 && p.lng_deg <= 180.0);
  return true;
}

bool Test_Searcher_RejectsNonPositiveSpeed() {
  VesselConfig v;
  v.speed_kts = 0.0;
  SEAROUTE_EXPECT_THROWS(RouteSearcher(RouteSearcher::Dependencies{}, SearchConfig{}, v), std::invalid_argument);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  using searoute::test::TestCase;

  std::vector<TestCase> cases{
      {"PlanSteps", Test_PlanSteps},
      {"KeyDecimalsForStep", Test_KeyDecimalsForStep},
      {"NeighborGenerator: sixteen bearings", Test_Neighbors_SixteenBearings},
      {"NeighborGenerator: land filtered", Test_Neighbors_LandFiltered},
      {"Frontier: orders by f then insertion", Test_Frontier_OrdersByFThenInsertion},
      {"QuantizedKey", Test_QuantizedKey},
      {"VisitedTable: improve and stale", Test_VisitedTable_ImproveAndStale},
      {"CostModel: weights and modes", Test_CostModel_WeightsAndModes},
      {"Heuristic never exceeds direct cost", Test_Heuristic_NeverExceedsDirectCost},
      {"Search: open water reaches exact destination", Test_Search_OpenWaterReachesExactDestination},
      {"Search: deterministic", Test_Search_Deterministic},
      {"Search: avoids land wall", Test_Search_AvoidsLandWall},
      {"Search: weather mode detours around storm", Test_Search_WeatherModeDetoursAroundStorm},
      {"Search: superseded heap entries are skipped", Test_Search_SupersededEntriesAreSkipped},
      {"Search: cost matches returned path (land + weather)", Test_Search_CostMatchesPathWithLand},
      {"Search: no weather -> modes agree", Test_Search_NoWeatherMeansModesAgreeOnGeometry},
      {"Search: origin == destination", Test_Search_SameOriginAndDestination},
      {"Search: trapped origin exhausts", Test_Search_TrappedOriginExhausts},
      {"Search: expansion limit", Test_Search_ExpansionLimit},
      {"Search: crosses antimeridian", Test_Search_CrossesAntimeridian},
      {"RouteSearcher: rejects non-positive speed", Test_Searcher_RejectsNonPositiveSpeed},
  };

  return searoute::test::RunAll(cases, argc, argv);
}
