#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "net/http_client.hpp"

namespace searoute {

// ======================
// 陆地掩膜
//
// 数据：GeoJSON FeatureCollection（Polygon / MultiPolygon），只取每个 polygon 的外环。
// 已知限制：不处理内环（洞）。陆地外环内部的内海/湖泊会被判成陆地；
// 低分辨率数据集基本只有外环，所以这里不做区分。
// ======================

// 一个外环 + 它的包围盒（包围盒只用于快速排除）
struct LandRing {
  std::vector<Point> vertices;
  BBox bbox;
};

class LandPolygonSet {
public:
  LandPolygonSet() = default;
  explicit LandPolygonSet(std::vector<LandRing> rings);

  // 射线法：落在任意一个外环内即为陆地
  bool Contains(const Point& p) const;

  std::size_t size() const { return rings_.size(); }
  bool empty() const { return rings_.empty(); }

private:
  std::vector<LandRing> rings_;
};

// 射线法点在多边形内判断（ring 按 [lng, lat] 平面处理，首尾是否重复都可以）
bool PointInRing(const Point& p, const std::vector<Point>& ring);

// 解析 GeoJSON。结构不对（不是 FeatureCollection / geometry 坐标不是数字数组）时抛 std::runtime_error。
LandPolygonSet ParseLandGeoJson(const nlohmann::json& doc);

enum class LandDataStatus {
  kLoaded,
  kUnavailable   // 本地、远程都拿不到：掩膜退化为“全是水”
};

struct LandLoadResult {
  LandDataStatus status{LandDataStatus::kUnavailable};
  std::shared_ptr<const LandPolygonSet> polygons;
  std::string source;   // "local:<path>" / "remote:<url>"
  std::string error;    // kUnavailable 时说明原因
};

// 先读本地文件，再回退到远程 URL。任何失败都不抛异常，只体现在返回的 status 上。
LandLoadResult LoadLandPolygons(const LandMaskConfig& cfg, net::IHttpClient* http);

// 搜索引擎只依赖这个接口
class ILandMask {
public:
  virtual ~ILandMask() = default;
  virtual bool IsLand(const Point& p) const = 0;
};

// 进程级缓存：第一次 EnsureReady 时加载（std::call_once 保证只加载一次），
// 之后所有请求只读共享。
class LandMaskProvider final : public ILandMask {
public:
  using Loader = std::function<LandLoadResult()>;

  LandMaskProvider() = default;
  LandMaskProvider(const LandMaskProvider&) = delete;
  LandMaskProvider& operator=(const LandMaskProvider&) = delete;

  static LandMaskProvider& Instance();

  const LandLoadResult& EnsureReady(const LandMaskConfig& cfg, net::IHttpClient* http);
  const LandLoadResult& EnsureReady(const Loader& loader);

  // 未加载 / 加载失败时永远返回 false
  bool IsLand(const Point& p) const override;

  bool loaded() const;
  std::string source() const;

private:
  std::once_flag once_;
  std::atomic<bool> ready_{false};
  LandLoadResult result_;
};

} // namespace searoute
