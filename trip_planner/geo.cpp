#include "geo.hpp"
#include <algorithm>
#include <cmath>

static double to_radians(double deg) {
    static const double PI = std::acos(-1.0);
    return deg * PI / 180.0;
}

double haversine_km(const Location &a, const Location &b) {
    double dlat = to_radians(b.lat - a.lat);
    double dlng = to_radians(b.lng - a.lng);

    double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
               std::cos(to_radians(a.lat)) * std::cos(to_radians(b.lat)) *
               std::sin(dlng / 2) * std::sin(dlng / 2);
    // rounding can push h just past 1 for antipodal points
    h = std::min(1.0, std::max(0.0, h));
    double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
    return EARTH_RADIUS_KM * c;
}
