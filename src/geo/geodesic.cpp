#include "geo/geodesic.hpp"

#include <algorithm>
#include <cmath>

namespace searoute::geo {

double Deg2Rad(double deg) { return deg * kPi / 180.0; }

double Rad2Deg(double rad) { return rad * 180.0 / kPi; }

double NormalizeLng(double lng_deg) {
  double x = std::fmod(lng_deg + 180.0, 360.0);
  if (x < 0.0) x += 360.0;
  const double out = x - 180.0;
  // -180 与 180 是同一条经线，统一取 180
  return (out <= -180.0) ? 180.0 : out;
}

double DistanceNm(const Point& a, const Point& b) {
  const double dlat = Deg2Rad(b.lat_deg - a.lat_deg);
  const double dlng = Deg2Rad(b.lng_deg - a.lng_deg);
  const double s_lat = std::sin(dlat / 2.0);
  const double s_lng = std::sin(dlng / 2.0);
  const double h = s_lat * s_lat +
                   std::cos(Deg2Rad(a.lat_deg)) * std::cos(Deg2Rad(b.lat_deg)) * s_lng * s_lng;
  const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(std::max(0.0, 1.0 - h)));
  return kEarthRadiusNm * c;
}

Point DestinationPoint(const Point& origin, double bearing_deg, double distance_nm) {
  const double delta = distance_nm / kEarthRadiusNm;
  const double theta = Deg2Rad(bearing_deg);
  const double lat1 = Deg2Rad(origin.lat_deg);
  const double lng1 = Deg2Rad(origin.lng_deg);

  const double sin_lat2 = std::sin(lat1) * std::cos(delta) +
                          std::cos(lat1) * std::sin(delta) * std::cos(theta);
  const double lat2 = std::asin(std::clamp(sin_lat2, -1.0, 1.0));
  const double lng2 = lng1 + std::atan2(std::sin(theta) * std::sin(delta) * std::cos(lat1),
                                        std::cos(delta) - std::sin(lat1) * std::sin(lat2));

  return {Rad2Deg(lat2), NormalizeLng(Rad2Deg(lng2))};
}

BBox TripBBox(const Point& origin, const Point& destination) {
  BBox b;
  b.min_lat = std::min(origin.lat_deg, destination.lat_deg);
  b.max_lat = std::max(origin.lat_deg, destination.lat_deg);
  b.min_lng = std::min(origin.lng_deg, destination.lng_deg);
  b.max_lng = std::max(origin.lng_deg, destination.lng_deg);
  return b;
}

} // namespace searoute::geo
