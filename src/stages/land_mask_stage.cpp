#include "stages/land_mask_stage.hpp"

namespace searoute {

LandMaskStage::LandMaskStage(LandMaskProvider* provider, net::IHttpClient* http)
    : provider_(provider), http_(http) {}

void LandMaskStage::Run(RouteContext& ctx) {
  ctx.debug.land_mask_loaded = false;
  ctx.debug.land_mask_source.clear();

  if (!ctx.config.land_mask.enabled || provider_ == nullptr) return;

  // 只有进程内第一次调用会真正加载，之后直接返回缓存结果
  const LandLoadResult& r = provider_->EnsureReady(ctx.config.land_mask, http_);
  ctx.debug.land_mask_loaded = (r.status == LandDataStatus::kLoaded);
  ctx.debug.land_mask_source = r.source;
}

} // namespace searoute
