#pragma once
#include "landmask/land_mask.hpp"
#include "net/http_client.hpp"
#include "stages/stage_base.hpp"

namespace searoute {

// ======================
// 环节：陆地掩膜准备
// 流程位置：请求校验 -> 陆地掩膜 -> 天气
//
// 输入：
//   ctx.config.land_mask（本地路径 / 远程 URL / 超时）
//
// 输出：
//   ctx.debug.land_mask_loaded / land_mask_source
//
// 注意：掩膜是进程级共享的，只有第一个请求真正加载；加载失败不报错，
// 之后所有请求都按“全是水”搜索。
// ======================
class LandMaskStage final : public IStage {
public:
  LandMaskStage(LandMaskProvider* provider, net::IHttpClient* http);
  void Run(RouteContext& ctx) override;

private:
  LandMaskProvider* provider_;
  net::IHttpClient* http_;
};

} // namespace searoute
