#include "geo/GeoUtil.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace geoutil {

static constexpr double kPi = 3.14159265358979323846;

static double to_radians(double deg) {
    return deg * kPi / 180.0;
}

double haversine_miles(const ranker::GeoPoint& a, const ranker::GeoPoint& b) {
    const double lat1 = to_radians(a.latitude);
    const double lat2 = to_radians(b.latitude);
    const double dlat = to_radians(b.latitude - a.latitude);
    const double dlon = to_radians(b.longitude - a.longitude);

    const double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);

    const double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
    return kEarthRadiusMiles * c;
}

double distance_to_segment_miles(const ranker::GeoPoint& p,
                                 const ranker::GeoPoint& a,
                                 const ranker::GeoPoint& b) {
    const double miles_per_deg = kEarthRadiusMiles * kPi / 180.0;
    const double lon_scale = std::cos(to_radians(p.latitude)) * miles_per_deg;

    // p sits at the origin
    const double ax = (a.longitude - p.longitude) * lon_scale;
    const double ay = (a.latitude - p.latitude) * miles_per_deg;
    const double bx = (b.longitude - p.longitude) * lon_scale;
    const double by = (b.latitude - p.latitude) * miles_per_deg;

    const double dx = bx - ax;
    const double dy = by - ay;
    const double len2 = dx * dx + dy * dy;
    if (len2 <= 0.0) return haversine_miles(p, a);

    const double t = std::clamp(-(ax * dx + ay * dy) / len2, 0.0, 1.0);
    const double cx = ax + t * dx;
    const double cy = ay + t * dy;
    return std::sqrt(cx * cx + cy * cy);
}

std::string format_distance(double miles) {
    if (miles < 0.1) return "< 0.1 mi";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f mi", miles);
    return buf;
}

}
