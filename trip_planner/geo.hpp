#pragma once

struct Location {
    double lat; // degrees
    double lng; // degrees
};

constexpr double EARTH_RADIUS_KM = 6371.0;

// Great-circle distance in km (haversine). Ranges are not checked here.
double haversine_km(const Location &a, const Location &b);
