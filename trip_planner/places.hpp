#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "geo.hpp"

struct Place {
    std::string id;
    std::string name;
    Location location;
    double rating;                 // expected 0-5
    double visit_duration_minutes;
};

// A required field was absent from an incoming record.
class MissingFieldError : public std::runtime_error {
public:
    explicit MissingFieldError(const std::string &field);
    const std::string &field() const { return field_; }

private:
    std::string field_;
};

class InvalidPlaceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Accepts {"lat", "lng"} ("lon" works as an alias of "lng").
Location location_from_json(const nlohmann::json &j);

// Accepts flat {"id", "name", "lat", "lng", "rating", "visit_duration_minutes"}
// or the coordinates nested under "location". "id" may be a string or a number.
Place place_from_json(const nlohmann::json &j);
std::vector<Place> places_from_json(const nlohmann::json &arr);

nlohmann::json place_to_json(const Place &p);

// Strict checks, only run when the planner is configured for them.
void validate_location(const Location &loc);
void validate_place(const Place &p);
