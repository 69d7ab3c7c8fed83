#pragma once
#include "common/types.hpp"

namespace searoute::geo {

constexpr double kPi = 3.14159265358979323846;
constexpr double kEarthRadiusNm = 3440.065;

double Deg2Rad(double deg);
double Rad2Deg(double rad);

// 经度归一化到 (-180, 180]
double NormalizeLng(double lng_deg);

// 大圆距离（haversine），单位 nm
double DistanceNm(const Point& a, const Point& b);

// 球面正解：从 origin 沿 bearing_deg（0 = 北，顺时针）走 distance_nm
Point DestinationPoint(const Point& origin, double bearing_deg, double distance_nm);

// origin/destination 的经纬度包围盒（不处理跨 180° 经线的情况）
BBox TripBBox(const Point& origin, const Point& destination);

} // namespace searoute::geo
