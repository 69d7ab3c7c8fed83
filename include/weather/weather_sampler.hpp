#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "net/http_client.hpp"

namespace searoute {

// 海况风险归一化：浪高 / 风浪高各自除以上限并截断到 [0,1]，再加权
constexpr double kMaxWaveM = 5.0;
constexpr double kMaxWindWaveM = 4.0;
constexpr double kWaveRiskWeight = 0.65;
constexpr double kWindWaveRiskWeight = 0.35;

double NormalizedRisk(const WeatherSample& s);

// 按 round(elapsed_hours) 取样，越界时截断到首/尾；序列为空返回全 0
WeatherSample SampleSeries(const WeatherSeries& series, double elapsed_hours);

// Open-Meteo marine 接口 URL：在 bbox 上取 grid_size x grid_size 个点位
std::string BuildForecastUrl(const WeatherConfig& cfg, const BBox& bbox);

// 解析 Open-Meteo 返回（单点位是 object，多点位是 array）。
// 没有任何可用的小时序列时返回 nullopt。
std::optional<WeatherField> ParseForecast(const nlohmann::json& doc);

// 网络 / 解析失败都返回 nullopt（调用方按 0 风险处理），不抛异常
std::optional<WeatherField> FetchForecast(const WeatherConfig& cfg,
                                          const BBox& bbox,
                                          net::IHttpClient* http);

// 读本地预报文件（同 Open-Meteo 格式）。失败返回 nullopt。
std::optional<WeatherField> LoadForecastFile(const std::string& path);

// 搜索 / 输出阶段的取样入口。field 为空指针 = 预报不可用，风险恒为 0。
class WeatherSampler {
public:
  explicit WeatherSampler(const WeatherField* field = nullptr);

  bool available() const { return field_ != nullptr && !field_->stations.empty(); }

  // 离 p 最近（大圆距离）的预报点位在 elapsed_hours 的海况
  WeatherSample Sample(const Point& p, double elapsed_hours) const;
  double Risk(const Point& p, double elapsed_hours) const;

private:
  const WeatherStation* Nearest(const Point& p) const;

  const WeatherField* field_;
};

} // namespace searoute
