#include "io/output_writer.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <utility>

#include "search/cost_model.hpp"

namespace fs = std::filesystem;

namespace searoute::io {

using json = nlohmann::json;

namespace {

void EnsureDir(const fs::path& p) {
  if (!fs::exists(p)) {
    fs::create_directories(p);
  }
}

// 对外字段按整数输出（航程 / 时间 / 油耗都四舍五入）
long RoundInt(double v) { return std::lround(v); }

double Round2(double v) { return std::round(v * 100.0) / 100.0; }

json PointJson(const Point& p) {
  return json{{"lat", p.lat_deg}, {"lng", p.lng_deg}};
}

// GeoJSON 坐标顺序是 [lng, lat]
json GeoJsonOf(const RouteContext& ctx) {
  json coords = json::array();
  for (const auto& p : ctx.result.points) {
    coords.push_back(json::array({p.lng_deg, p.lat_deg}));
  }

  json feature;
  feature["type"] = "Feature";
  feature["properties"] = json{{"mode", ModeName(ctx.request.mode)}};
  feature["geometry"] = json{{"type", "LineString"}, {"coordinates", coords}};

  return json{{"type", "FeatureCollection"}, {"features", json::array({feature})}};
}

json SegmentsOf(const RouteResult& r) {
  json segs = json::array();
  for (const auto& leg : r.legs) {
    json s;
    s["from"] = PointJson(leg.from);
    s["to"] = PointJson(leg.to);
    s["distance_nm"] = Round2(leg.distance_nm);
    s["hours"] = Round2(leg.hours);
    s["eta_hours"] = Round2(leg.eta_hours);
    s["wave_height_m"] = Round2(leg.sea_state.wave_height_m);
    s["wind_wave_height_m"] = Round2(leg.sea_state.wind_wave_height_m);
    s["risk"] = Round2(leg.risk);
    s["hazards"] = leg.hazards;
    segs.push_back(std::move(s));
  }
  return segs;
}

} // namespace

json OutputWriter::BuildResponse(const RouteContext& ctx) {
  const RouteResult& r = ctx.result;

  json out;
  out["distance_nm"] = RoundInt(r.distance_nm);
  out["estimated_time_hours"] = RoundInt(r.time_hours);
  out["fuel_consumption_mt"] = RoundInt(r.fuel_mt);

  json pts = json::array();
  for (const auto& p : r.points) pts.push_back(PointJson(p));
  out["route_points"] = std::move(pts);
  out["geojson"] = GeoJsonOf(ctx);

  out["optimization"] = ModeName(ctx.request.mode);
  out["route_type"] = r.route_type;
  out["segments"] = SegmentsOf(r);
  out["weather_warnings"] = r.weather_warnings;
  out["safety_score"] = r.safety_score;

  json dbg;
  dbg["landMaskLoaded"] = ctx.debug.land_mask_loaded;
  dbg["landMaskSource"] = ctx.debug.land_mask_source;
  dbg["weatherSampled"] = ctx.debug.weather_sampled;
  dbg["searchReached"] = ctx.search.reached;
  dbg["expansions"] = ctx.search.expansions;
  dbg["staleDiscarded"] = ctx.search.stale_discarded;
  dbg["keyDecimals"] = ctx.search.key_decimals;
  dbg["stepNm"] = Round2(ctx.search.step_nm);
  out["debug"] = std::move(dbg);

  return out;
}

json OutputWriter::BuildError(const std::string& message) {
  return json{{"error", message}};
}

void OutputWriter::WriteAll(const RouteContext& ctx, const std::string& output_dir) {
  const fs::path outdir(output_dir);
  EnsureDir(outdir);
  WriteOutputJson(BuildResponse(ctx), (outdir / "output.json").string());
  WriteRouteCsv(ctx, (outdir / "route.csv").string());
}

void OutputWriter::WriteOutputJson(const json& response, const std::string& output_path) {
  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  ofs << response.dump(2) << "\n";
}

void OutputWriter::WriteRouteCsv(const RouteContext& ctx, const std::string& output_path) {
  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  ofs << "lat,lng\n";
  ofs << std::fixed << std::setprecision(6);
  for (const auto& p : ctx.result.points) {
    ofs << p.lat_deg << "," << p.lng_deg << "\n";
  }
}

} // namespace searoute::io
