#pragma once

constexpr double DEFAULT_AVERAGE_SPEED_KMH = 30.0; // urban average

// Minutes needed to cover distance_km at a constant average speed.
double estimate_travel_minutes(double distance_km, double average_speed_kmh = DEFAULT_AVERAGE_SPEED_KMH);
