#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "common/types.hpp"

namespace searoute::io {

// OutputWriter 负责把 ctx 中的“最终产物”转成响应 / 写盘：
// 1) BuildResponse：响应 JSON（distance_nm / estimated_time_hours / fuel_consumption_mt /
//    route_points / geojson，外加逐段海况、安全分和 debug）
// 2) output.json：BuildResponse 的结果
// 3) route.csv：航点 lat,lng
class OutputWriter {
public:
  static nlohmann::json BuildResponse(const RouteContext& ctx);

  // 错误响应体：{"error": message}
  static nlohmann::json BuildError(const std::string& message);

  static void WriteAll(const RouteContext& ctx, const std::string& output_dir);

  // 分开暴露接口，方便只写某一种输出进行调试
  static void WriteOutputJson(const nlohmann::json& response, const std::string& output_path);
  static void WriteRouteCsv(const RouteContext& ctx, const std::string& output_path);
};

} // namespace searoute::io
