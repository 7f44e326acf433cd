#pragma once
#include "nlohmann/json.hpp"
#include "config.hpp"

// Answers one planning request:
//   {"id", "current_location": {"lat", "lng"}, "available_time_minutes", "places": [...]}
// Failures are reported in the result as {"id", "error"} instead of thrown.
nlohmann::json process_request(const nlohmann::json &request, const PlannerConfig &cfg);
