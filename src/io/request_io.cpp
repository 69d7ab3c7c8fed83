#include "io/request_io.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

#include "geo/geodesic.hpp"
#include "search/cost_model.hpp"

namespace searoute::io {

namespace {

using json = nlohmann::json;

const char* const kInvalidPoints = "Invalid origin or destination";

Point ParsePoint(const json& body, const char* name) {
  if (!body.contains(name)) throw RequestError(kInvalidPoints);
  const json& p = body.at(name);
  if (!p.is_object()) throw RequestError(kInvalidPoints);
  if (!p.contains("lat") || !p.contains("lng")) throw RequestError(kInvalidPoints);
  if (!p["lat"].is_number() || !p["lng"].is_number()) throw RequestError(kInvalidPoints);

  const double lat = p["lat"].get<double>();
  const double lng = p["lng"].get<double>();
  if (!std::isfinite(lat) || !std::isfinite(lng)) throw RequestError(kInvalidPoints);
  if (lat < -90.0 || lat > 90.0) throw RequestError(kInvalidPoints);

  return {lat, geo::NormalizeLng(lng)};
}

} // namespace

RouteRequest RequestIO::ParseRequest(const json& body) {
  if (!body.is_object()) throw RequestError(kInvalidPoints);

  RouteRequest req;
  req.origin = ParsePoint(body, "origin");
  req.destination = ParsePoint(body, "destination");

  if (body.contains("optimization") && !body["optimization"].is_null()) {
    const json& m = body["optimization"];
    if (!m.is_string()) throw RequestError("Invalid optimization mode");
    const auto mode = ParseMode(m.get<std::string>());
    if (!mode) throw RequestError("Invalid optimization mode: " + m.get<std::string>());
    req.mode = *mode;
  } else {
    req.mode = OptimizationMode::kWeather;
  }
  return req;
}

json RequestIO::LoadRequestFile(const std::string& path) {
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Failed to open request file: " + path);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();

  json body = json::parse(oss.str(), nullptr, /*allow_exceptions=*/false);
  if (body.is_discarded()) {
    throw RequestError("Request body is not valid JSON");
  }
  return body;
}

} // namespace searoute::io
