#pragma once
#include <stdexcept>
#include <string>
#include "nlohmann/json.hpp"
#include "scoring.hpp"
#include "travel.hpp"

enum class ValidationPolicy {
    Permissive, // inputs are used as given
    Strict      // reject out-of-range coordinates, ratings and durations
};

struct PlannerConfig {
    ScoringWeights weights;
    double average_speed_kmh = DEFAULT_AVERAGE_SPEED_KMH;
    ValidationPolicy validation = ValidationPolicy::Permissive;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing keys keep their defaults.
PlannerConfig config_from_json(const nlohmann::json &j);
PlannerConfig load_config(const std::string &path);

std::string to_string(ValidationPolicy policy);
