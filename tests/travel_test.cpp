#include <gtest/gtest.h>
#include "travel.hpp"

TEST(TravelTimeTest, MatchesFormula) {
    for (double d : {0.0, 0.5, 1.0, 7.25, 30.0, 291.0, 10000.0})
        EXPECT_DOUBLE_EQ(estimate_travel_minutes(d), (d / 30) * 60);
}

TEST(TravelTimeTest, ZeroDistanceIsZeroMinutes) {
    EXPECT_EQ(estimate_travel_minutes(0.0), 0.0);
}

TEST(TravelTimeTest, IncreasesWithDistance) {
    EXPECT_LT(estimate_travel_minutes(1.0), estimate_travel_minutes(2.0));
    EXPECT_DOUBLE_EQ(estimate_travel_minutes(15.0), 30.0);
}

TEST(TravelTimeTest, CustomSpeed) {
    EXPECT_DOUBLE_EQ(estimate_travel_minutes(60.0, 60.0), 60.0);
    EXPECT_DOUBLE_EQ(estimate_travel_minutes(10.0, 20.0), 30.0);
}
