#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "config.hpp"

using json = nlohmann::json;

TEST(ConfigTest, Defaults) {
    PlannerConfig cfg = config_from_json(json::object());
    EXPECT_DOUBLE_EQ(cfg.average_speed_kmh, 30.0);
    EXPECT_DOUBLE_EQ(cfg.weights.rating_weight, 10.0);
    EXPECT_DOUBLE_EQ(cfg.weights.distance_weight, 2.0);
    EXPECT_EQ(cfg.validation, ValidationPolicy::Permissive);
}

TEST(ConfigTest, Overrides) {
    json j = {
        {"average_speed_kmh", 45.0},
        {"rating_weight", 12},
        {"distance_weight", 0.5},
        {"validation", "strict"}
    };
    PlannerConfig cfg = config_from_json(j);
    EXPECT_DOUBLE_EQ(cfg.average_speed_kmh, 45.0);
    EXPECT_DOUBLE_EQ(cfg.weights.rating_weight, 12.0);
    EXPECT_DOUBLE_EQ(cfg.weights.distance_weight, 0.5);
    EXPECT_EQ(cfg.validation, ValidationPolicy::Strict);
    EXPECT_EQ(to_string(cfg.validation), "strict");
}

TEST(ConfigTest, RejectsBadValues) {
    EXPECT_THROW((config_from_json(json{{"validation", "lenient"}})), ConfigError);
    EXPECT_THROW((config_from_json(json{{"average_speed_kmh", 0}})), ConfigError);
    EXPECT_THROW((config_from_json(json{{"average_speed_kmh", -5}})), ConfigError);
    EXPECT_THROW((config_from_json(json{{"average_speed_kmh", "fast"}})), ConfigError);
    EXPECT_THROW(config_from_json(json::array()), ConfigError);
}

TEST(ConfigTest, LoadFromFile) {
    const std::string path = "trip_planner_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"distance_weight": 3, "validation": "permissive"})";
    }
    PlannerConfig cfg = load_config(path);
    EXPECT_DOUBLE_EQ(cfg.weights.distance_weight, 3.0);
    EXPECT_DOUBLE_EQ(cfg.weights.rating_weight, 10.0);
    std::remove(path.c_str());
}

TEST(ConfigTest, LoadFailures) {
    EXPECT_THROW(load_config("does/not/exist.json"), ConfigError);

    const std::string path = "trip_planner_broken_config.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(load_config(path), ConfigError);
    std::remove(path.c_str());
}
