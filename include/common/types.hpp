#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace searoute {

// ========================
// 1) 基础地理类型
// ========================

// 经纬度（度）。lng 归一化到 (-180, 180]，lat 在 [-90, 90]。
struct Point {
  double lat_deg{0.0};
  double lng_deg{0.0};
};

// 航程包围盒（请求天气预报时使用）
struct BBox {
  double min_lat{0.0};
  double max_lat{0.0};
  double min_lng{0.0};
  double max_lng{0.0};
};

// ========================
// 2) 优化模式 / 代价权重
// ========================

enum class OptimizationMode {
  kTime,
  kFuel,
  kWeather
};

struct CostWeights {
  double distance{1.0};
  double weather{0.0};
};

// ========================
// 3) 天气（海况）数据
// ========================

// 单个小时的海况采样，单位 m
struct WeatherSample {
  double wave_height_m{0.0};
  double wind_wave_height_m{0.0};
};

// 按小时排列：hourly[0] 对应出发时刻，hourly[i] 对应出发后第 i 小时
struct WeatherSeries {
  std::vector<WeatherSample> hourly;
};

// 一个预报点位 + 它的小时序列
struct WeatherStation {
  Point location;
  WeatherSeries series;
};

// 覆盖整个航程包围盒的预报场。只有一个 station 时退化为“整个区域一条时间序列”。
struct WeatherField {
  std::vector<WeatherStation> stations;
};

// ========================
// 4) 配置（默认值即线上默认值，可被 config.json 覆盖）
// ========================

struct SearchConfig {
  int    base_resolution{15};
  int    max_steps{60};
  double min_step_nm{1.0};
  double reach_threshold_nm{3.0};
  // visited 表 key 的小数位数；-1 表示按步长推导
  int    key_decimals{-1};
  int    max_key_decimals{4};
  double key_cells_per_step{10.0};
  std::size_t max_expansions{2000000};
};

struct VesselConfig {
  double speed_kts{20.0};
  double fuel_tph{2.5};
};

struct LandMaskConfig {
  bool enabled{true};
  std::string local_path{"data/land_110m.geojson"};
  std::string remote_url{
      "https://raw.githubusercontent.com/datasets/geo-boundaries-world-110m/master/countries.geojson"};
  long timeout_s{20};
};

struct WeatherConfig {
  bool enabled{true};
  std::string local_path;
  std::string base_url{"https://marine-api.open-meteo.com/v1/marine"};
  int  grid_size{2};
  int  forecast_days{2};
  long timeout_s{10};
};

struct RouterConfig {
  SearchConfig search;
  VesselConfig vessel;
  LandMaskConfig land_mask;
  WeatherConfig weather;
};

// ========================
// 5) 请求 / 结果
// ========================

struct RouteRequest {
  Point origin;
  Point destination;
  OptimizationMode mode{OptimizationMode::kWeather};
};

// 输出的每一段航段（相邻两个航点之间）
struct RouteLeg {
  Point from;
  Point to;
  double distance_nm{0.0};
  double hours{0.0};
  double eta_hours{0.0};        // 到达 to 时距出发的小时数
  WeatherSample sea_state;      // eta_hours 时刻、最近预报点的海况
  double risk{0.0};
  std::vector<std::string> hazards;
};

struct RouteResult {
  std::vector<Point> points;    // origin -> destination（含两端）
  double distance_nm{0.0};
  double time_hours{0.0};
  double fuel_mt{0.0};
  std::string route_type;       // coastal / regional / oceanic / transoceanic
  std::vector<RouteLeg> legs;
  std::vector<std::string> weather_warnings;
  double safety_score{100.0};
};

// 搜索过程的诊断量（写入 response.debug）
struct SearchDiagnostics {
  bool reached{false};
  std::size_t expansions{0};
  std::size_t stale_discarded{0};
  int key_decimals{0};
  double step_nm{0.0};
};

struct DebugInfo {
  bool land_mask_loaded{false};
  bool weather_sampled{false};
  std::string land_mask_source;
};

// ========================
// 6) 一次请求的上下文（各 Stage 之间传递）
// ========================

struct RouteContext {
  // === 输入 ===
  RouteRequest request;
  RouterConfig config;

  // === 中间结果 ===
  std::optional<WeatherField> weather;  // nullopt = 预报不可用，按 0 风险处理
  SearchDiagnostics search;

  // === 输出 ===
  RouteResult result;
  DebugInfo debug;
};

} // namespace searoute
