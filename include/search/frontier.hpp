#pragma once
#include <cstdint>
#include <queue>
#include <string>
#include <utility>
#include <vector>

#include "common/types.hpp"

namespace searoute {

// 搜索节点：入堆后不再修改；同一位置找到更便宜的路径时压入新节点（旧节点变为 stale）
struct SearchNode {
  Point point;
  std::string key;          // 量化后的位置 key
  double g{0.0};            // 起点到此的累计代价
  double h{0.0};            // 启发式
  double f{0.0};            // g + h
  std::size_t trail{0};     // 对应的 Trail 记录下标（含前驱链）
  double elapsed_hours{0.0};
  std::uint64_t seq{0};     // 入堆顺序，f 相同时先入先出，保证结果确定
};

// 最小堆：f 小的先出；f 相同按入堆顺序
class Frontier {
public:
  void Push(SearchNode node) {
    node.seq = next_seq_++;
    heap_.push(std::move(node));
  }

  SearchNode Pop() {
    SearchNode top = heap_.top();
    heap_.pop();
    return top;
  }

  bool empty() const { return heap_.empty(); }
  std::size_t size() const { return heap_.size(); }

private:
  struct Greater {
    bool operator()(const SearchNode& a, const SearchNode& b) const {
      if (a.f != b.f) return a.f > b.f;
      return a.seq > b.seq;
    }
  };

  std::priority_queue<SearchNode, std::vector<SearchNode>, Greater> heap_;
  std::uint64_t next_seq_{0};
};

} // namespace searoute
