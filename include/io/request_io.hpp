#pragma once
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "common/types.hpp"

namespace searoute::io {

// 请求不合法（坐标缺失 / 非数字 / 越界，模式未知）。对外映射为 400。
class RequestError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// 请求格式：
//   {
//     "origin":      {"lat": 1.3521,  "lng": 103.8198},
//     "destination": {"lat": 51.9244, "lng": 4.4777},
//     "optimization": "time" | "fuel" | "weather"     // 缺省为 weather
//   }
class RequestIO {
public:
  // 校验并转换；不合法时抛 RequestError
  static RouteRequest ParseRequest(const nlohmann::json& body);

  // 读文件 + 解析 JSON；文件打不开抛 std::runtime_error，JSON 本身不合法抛 RequestError
  static nlohmann::json LoadRequestFile(const std::string& path);
};

} // namespace searoute::io
