#pragma once
#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "pipeline/pipeline.hpp"

namespace searoute {

// 一次请求的响应：HTTP 语义的状态码 + JSON 体
struct ServiceResponse {
  int status{200};
  nlohmann::json body;
};

// 对外边界：请求校验 -> Pipeline -> 响应 JSON
//   请求不合法     -> 400 {"error": "Invalid origin or destination"}（或模式错误的说明）
//   其它内部异常   -> 500 {"error": "Failed to optimize route"}，细节只写日志
// 陆地 / 天气数据不可用不算错误，只体现在 debug 字段。
class RouteService {
public:
  RouteService(RouterConfig config, Pipeline::Dependencies deps);

  ServiceResponse Handle(const nlohmann::json& request_body);

  // 已校验的请求直接跑流程，返回完整上下文；内部异常原样抛出
  RouteContext Optimize(const RouteRequest& request);

  const RouterConfig& config() const { return config_; }

private:
  RouterConfig config_;
  Pipeline pipeline_;
};

} // namespace searoute
