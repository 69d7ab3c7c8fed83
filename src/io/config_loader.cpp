#include "io/config_loader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace searoute::io {

namespace {

using json = nlohmann::json;

std::string ReadAllText(const std::string& path) {
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Failed to open config file: " + path);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

json Section(const json& doc, const char* name) {
  if (!doc.contains(name)) return json::object();
  const json& s = doc.at(name);
  if (!s.is_object()) {
    throw std::runtime_error(std::string("config section '") + name + "' must be an object");
  }
  return s;
}

void Require(bool ok, const char* what) {
  if (!ok) throw std::runtime_error(std::string("invalid config: ") + what);
}

} // namespace

RouterConfig ConfigLoader::Load(const std::string& path) {
  const std::string text = ReadAllText(path);
  json doc;
  try {
    doc = json::parse(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("JSON parse failed for " + path + ": " + std::string(e.what()));
  }

  RouterConfig cfg;
  Apply(doc, cfg);
  return cfg;
}

void ConfigLoader::Apply(const json& doc, RouterConfig& cfg) {
  if (!doc.is_object()) throw std::runtime_error("config root must be an object");

  try {
    const json search = Section(doc, "search");
    auto& s = cfg.search;
    s.base_resolution    = search.value("base_resolution", s.base_resolution);
    s.max_steps          = search.value("max_steps", s.max_steps);
    s.min_step_nm        = search.value("min_step_nm", s.min_step_nm);
    s.reach_threshold_nm = search.value("reach_threshold_nm", s.reach_threshold_nm);
    s.key_decimals       = search.value("key_decimals", s.key_decimals);
    s.max_key_decimals   = search.value("max_key_decimals", s.max_key_decimals);
    s.key_cells_per_step = search.value("key_cells_per_step", s.key_cells_per_step);
    s.max_expansions     = search.value("max_expansions", s.max_expansions);

    const json vessel = Section(doc, "vessel");
    cfg.vessel.speed_kts = vessel.value("speed_kts", cfg.vessel.speed_kts);
    cfg.vessel.fuel_tph  = vessel.value("fuel_tph", cfg.vessel.fuel_tph);

    const json land = Section(doc, "land_mask");
    auto& l = cfg.land_mask;
    l.enabled    = land.value("enabled", l.enabled);
    l.local_path = land.value("local_path", l.local_path);
    l.remote_url = land.value("remote_url", l.remote_url);
    l.timeout_s  = land.value("timeout_s", l.timeout_s);

    const json weather = Section(doc, "weather");
    auto& w = cfg.weather;
    w.enabled       = weather.value("enabled", w.enabled);
    w.local_path    = weather.value("local_path", w.local_path);
    w.base_url      = weather.value("base_url", w.base_url);
    w.grid_size     = weather.value("grid_size", w.grid_size);
    w.forecast_days = weather.value("forecast_days", w.forecast_days);
    w.timeout_s     = weather.value("timeout_s", w.timeout_s);
  } catch (const json::exception& e) {
    // 字段类型不对（比如 "speed_kts": "fast"）
    throw std::runtime_error("invalid config value: " + std::string(e.what()));
  }

  Validate(cfg);
}

void ConfigLoader::Validate(const RouterConfig& cfg) {
  Require(cfg.search.base_resolution >= 1, "search.base_resolution must be >= 1");
  Require(cfg.search.max_steps >= cfg.search.base_resolution, "search.max_steps must be >= base_resolution");
  Require(cfg.search.min_step_nm > 0.0, "search.min_step_nm must be > 0");
  Require(cfg.search.reach_threshold_nm > 0.0, "search.reach_threshold_nm must be > 0");
  Require(cfg.search.key_decimals >= -1 && cfg.search.key_decimals <= 8, "search.key_decimals must be in [-1, 8]");
  Require(cfg.search.max_key_decimals >= 0 && cfg.search.max_key_decimals <= 8, "search.max_key_decimals must be in [0, 8]");
  Require(cfg.search.key_cells_per_step >= 1.0, "search.key_cells_per_step must be >= 1");
  Require(cfg.search.max_expansions > 0, "search.max_expansions must be > 0");
  Require(cfg.vessel.speed_kts > 0.0, "vessel.speed_kts must be > 0");
  Require(cfg.vessel.fuel_tph >= 0.0, "vessel.fuel_tph must be >= 0");
  Require(cfg.land_mask.timeout_s > 0, "land_mask.timeout_s must be > 0");
  Require(cfg.weather.grid_size >= 1, "weather.grid_size must be >= 1");
  Require(cfg.weather.forecast_days >= 1, "weather.forecast_days must be >= 1");
  Require(cfg.weather.timeout_s > 0, "weather.timeout_s must be > 0");
}

} // namespace searoute::io
