#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "geo.hpp"

static const Location BANGALORE{12.9716, 77.5946};
static const Location CHENNAI{13.0827, 80.2707};

TEST(HaversineTest, SamePointIsZero) {
    std::vector<Location> pts = {BANGALORE, CHENNAI, {0.0, 0.0}, {-33.8688, 151.2093}, {89.9, -179.9}};
    for (const auto &p : pts)
        EXPECT_NEAR(haversine_km(p, p), 0.0, 1e-6);
}

TEST(HaversineTest, Symmetric) {
    std::vector<Location> pts = {BANGALORE, CHENNAI, {51.5074, -0.1278}, {-33.8688, 151.2093}};
    for (const auto &a : pts)
        for (const auto &b : pts)
            EXPECT_DOUBLE_EQ(haversine_km(a, b), haversine_km(b, a));
}

TEST(HaversineTest, BangaloreToChennai) {
    EXPECT_NEAR(haversine_km(BANGALORE, CHENNAI), 292.5, 7.5);
}

TEST(HaversineTest, QuarterOfEquator) {
    double expected = EARTH_RADIUS_KM * std::acos(-1.0) / 2;
    EXPECT_NEAR(haversine_km({0.0, 0.0}, {0.0, 90.0}), expected, 1e-6);
}

TEST(HaversineTest, AntipodalPointsAreHalfCircumference) {
    double expected = EARTH_RADIUS_KM * std::acos(-1.0);
    EXPECT_NEAR(haversine_km({-88.2, -180.0}, {88.2, 0.0}), expected, 1e-3);
    EXPECT_NEAR(haversine_km({0.0, 0.0}, {0.0, 180.0}), expected, 1e-3);

    for (double lat = -89.5; lat <= 89.5; lat += 0.1) {
        for (double lng = -180.0; lng <= 0.0; lng += 7.5) {
            double d = haversine_km({lat, lng}, {-lat, lng + 180.0});
            ASSERT_FALSE(std::isnan(d)) << lat << "," << lng;
            EXPECT_NEAR(d, expected, 1e-3);
        }
    }
}
