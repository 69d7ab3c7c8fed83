#pragma once
#include "common/types.hpp"

namespace searoute {

// 每个“环节”都实现一个 Stage，输入输出都通过 RouteContext 传递。
// Pipeline 顺序调用各 Stage；环节之间只通过 ctx 交换数据。
class IStage {
public:
  virtual ~IStage() = default;
  virtual void Run(RouteContext& ctx) = 0;
};

} // namespace searoute
