#pragma once
#include <string>

#include "ranker/Models.hpp"

namespace geoutil {

constexpr double kEarthRadiusMiles = 3958.8;

// great-circle distance (haversine), miles
double haversine_miles(const ranker::GeoPoint& a, const ranker::GeoPoint& b);

// distance from p to the segment a-b, miles. Uses a local equirectangular
// projection around p, which is accurate at commute scale.
double distance_to_segment_miles(const ranker::GeoPoint& p,
                                 const ranker::GeoPoint& a,
                                 const ranker::GeoPoint& b);

// "< 0.1 mi", "2.3 mi"
std::string format_distance(double miles);

}
