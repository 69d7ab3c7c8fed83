#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>

#include "common/types.hpp"

namespace searoute {

// 量化 key："lat,lng"，各保留 decimals 位小数（-0.000 统一写成 0.000）
std::string QuantizedKey(const Point& p, int decimals);

// visited 表每个位置的当前最优记录。路径本身不存这里：
// trail 指向搜索里只增不改的路径记录，格子被更便宜的路径取代时旧链仍完整
struct VisitedEntry {
  double g{0.0};
  std::size_t trail{0};
};

// 一次搜索私有；只增不删，搜索结束随请求销毁
class VisitedTable {
public:
  const VisitedEntry* Find(const std::string& key) const;

  // 比现有记录严格更便宜（或尚无记录）才写入，返回是否写入
  bool Improve(const std::string& key, const VisitedEntry& entry);

  // 出堆校验：节点的 g 仍是该位置的当前最优才算有效，否则是被取代的旧节点
  bool IsCurrent(const std::string& key, double g) const;

  std::size_t size() const { return entries_.size(); }

private:
  std::unordered_map<std::string, VisitedEntry> entries_;
};

} // namespace searoute
