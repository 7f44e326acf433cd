#include "travel.hpp"

double estimate_travel_minutes(double distance_km, double average_speed_kmh) {
    return (distance_km / average_speed_kmh) * 60;
}
