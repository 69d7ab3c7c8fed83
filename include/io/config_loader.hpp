#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "common/types.hpp"

namespace searoute::io {

// config.json 结构（全部可选，缺省用 types.hpp 里的默认值）：
//   {
//     "search":    {"base_resolution": 15, "max_steps": 60, "min_step_nm": 1.0,
//                   "reach_threshold_nm": 3.0, "key_decimals": -1, "max_key_decimals": 4,
//                   "key_cells_per_step": 10, "max_expansions": 2000000},
//     "vessel":    {"speed_kts": 20, "fuel_tph": 2.5},
//     "land_mask": {"enabled": true, "local_path": "...", "remote_url": "...", "timeout_s": 20},
//     "weather":   {"enabled": true, "local_path": "", "base_url": "...",
//                   "grid_size": 2, "forecast_days": 2, "timeout_s": 10}
//   }
class ConfigLoader {
public:
  // 文件打不开 / JSON 不合法 / 取值越界都抛 std::runtime_error
  static RouterConfig Load(const std::string& path);

  // 把 doc 中出现的字段覆盖到 cfg 上，然后校验
  static void Apply(const nlohmann::json& doc, RouterConfig& cfg);

  static void Validate(const RouterConfig& cfg);
};

} // namespace searoute::io
