#include "config.hpp"
#include <cmath>
#include <fstream>
using json = nlohmann::json;

static ValidationPolicy parse_policy(const std::string &s) {
    if (s == "permissive") return ValidationPolicy::Permissive;
    if (s == "strict") return ValidationPolicy::Strict;
    throw ConfigError("unknown validation policy '" + s + "'");
}

std::string to_string(ValidationPolicy policy) {
    return policy == ValidationPolicy::Strict ? "strict" : "permissive";
}

PlannerConfig config_from_json(const json &j) {
    PlannerConfig cfg;
    if (j.is_null()) return cfg;
    if (!j.is_object())
        throw ConfigError("config must be a JSON object");

    try {
        cfg.average_speed_kmh = j.value("average_speed_kmh", cfg.average_speed_kmh);
        cfg.weights.rating_weight = j.value("rating_weight", cfg.weights.rating_weight);
        cfg.weights.distance_weight = j.value("distance_weight", cfg.weights.distance_weight);
        if (j.contains("validation"))
            cfg.validation = parse_policy(j["validation"].get<std::string>());
    } catch (const json::exception &e) {
        throw ConfigError(std::string("bad config value: ") + e.what());
    }

    if (!std::isfinite(cfg.average_speed_kmh) || cfg.average_speed_kmh <= 0.0)
        throw ConfigError("average_speed_kmh must be a positive number");
    if (!std::isfinite(cfg.weights.rating_weight) || !std::isfinite(cfg.weights.distance_weight))
        throw ConfigError("scoring weights must be finite");

    return cfg;
}

PlannerConfig load_config(const std::string &path) {
    std::ifstream fin(path);
    if (!fin)
        throw ConfigError("could not open config file: " + path);

    json j;
    try {
        fin >> j;
    } catch (const json::exception &e) {
        throw ConfigError("error parsing config JSON: " + std::string(e.what()));
    }
    return config_from_json(j);
}
