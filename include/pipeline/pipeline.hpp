#pragma once
#include <memory>
#include <vector>

#include "common/types.hpp"
#include "landmask/land_mask.hpp"
#include "net/http_client.hpp"
#include "stages/stage_base.hpp"

namespace searoute {

// Pipeline 负责把各 Stage 按流程顺序串起来：
//   陆地掩膜 -> 海况预报 -> 航路搜索 -> 指标
// 外部依赖（进程级陆地掩膜、HTTP 客户端）由调用方注入，测试里可以换成假实现。
class Pipeline {
public:
  struct Dependencies {
    LandMaskProvider* land_mask = nullptr;   // 空 = 不做陆地过滤
    net::IHttpClient* http = nullptr;        // 空 = 不访问网络（只用本地文件）
  };

  explicit Pipeline(Dependencies deps);
  void Run(RouteContext& ctx);

private:
  std::vector<std::unique_ptr<IStage>> stages_;
};

} // namespace searoute
