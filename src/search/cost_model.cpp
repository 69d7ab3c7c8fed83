#include "search/cost_model.hpp"

#include "geo/geodesic.hpp"

namespace searoute {

CostWeights WeightsFor(OptimizationMode mode) {
  switch (mode) {
    case OptimizationMode::kTime:    return {1.0, 0.8};
    case OptimizationMode::kFuel:    return {1.2, 0.6};
    case OptimizationMode::kWeather: return {0.75, 1.5};
  }
  return {1.0, 0.8};
}

const char* ModeName(OptimizationMode mode) {
  switch (mode) {
    case OptimizationMode::kTime:    return "time";
    case OptimizationMode::kFuel:    return "fuel";
    case OptimizationMode::kWeather: return "weather";
  }
  return "time";
}

std::optional<OptimizationMode> ParseMode(const std::string& name) {
  if (name == "time") return OptimizationMode::kTime;
  if (name == "fuel") return OptimizationMode::kFuel;
  if (name == "weather") return OptimizationMode::kWeather;
  return std::nullopt;
}

double Heuristic(const Point& p, const Point& destination, const CostWeights& w) {
  return w.distance * geo::DistanceNm(p, destination);
}

} // namespace searoute
