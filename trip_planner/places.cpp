#include "places.hpp"
#include <cmath>
using json = nlohmann::json;

MissingFieldError::MissingFieldError(const std::string &field)
    : std::runtime_error("missing required field '" + field + "'"), field_(field) {}

static const json &require(const json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null())
        throw MissingFieldError(key);
    return j[key];
}

static std::string id_string(const json &v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    throw std::runtime_error("field 'id' must be a string or an integer");
}

Location location_from_json(const json &j) {
    Location loc;
    loc.lat = require(j, "lat").get<double>();
    // "lon" is what the graph files use
    if (j.is_object() && !j.contains("lng") && j.contains("lon"))
        loc.lng = require(j, "lon").get<double>();
    else
        loc.lng = require(j, "lng").get<double>();
    return loc;
}

Place place_from_json(const json &j) {
    Place p;
    p.id = id_string(require(j, "id"));
    p.name = require(j, "name").get<std::string>();
    if (j.is_object() && j.contains("location"))
        p.location = location_from_json(j["location"]);
    else
        p.location = location_from_json(j);
    p.rating = require(j, "rating").get<double>();
    p.visit_duration_minutes = require(j, "visit_duration_minutes").get<double>();
    return p;
}

std::vector<Place> places_from_json(const json &arr) {
    if (!arr.is_array())
        throw std::runtime_error("places must be a JSON array");

    std::vector<Place> places;
    places.reserve(arr.size());
    for (const auto &jp : arr) places.push_back(place_from_json(jp));
    return places;
}

json place_to_json(const Place &p) {
    return {
        {"id", p.id},
        {"name", p.name},
        {"lat", p.location.lat},
        {"lng", p.location.lng},
        {"rating", p.rating},
        {"visit_duration_minutes", p.visit_duration_minutes}
    };
}

void validate_location(const Location &loc) {
    if (!std::isfinite(loc.lat) || loc.lat < -90.0 || loc.lat > 90.0)
        throw InvalidPlaceError("latitude out of range: " + std::to_string(loc.lat));
    if (!std::isfinite(loc.lng) || loc.lng < -180.0 || loc.lng > 180.0)
        throw InvalidPlaceError("longitude out of range: " + std::to_string(loc.lng));
}

void validate_place(const Place &p) {
    try {
        validate_location(p.location);
    } catch (const InvalidPlaceError &e) {
        throw InvalidPlaceError("place " + p.id + ": " + e.what());
    }
    if (!std::isfinite(p.rating) || p.rating < 0.0 || p.rating > 5.0)
        throw InvalidPlaceError("place " + p.id + ": rating must be within [0, 5]");
    if (!std::isfinite(p.visit_duration_minutes) || p.visit_duration_minutes < 0.0)
        throw InvalidPlaceError("place " + p.id + ": visit_duration_minutes must be >= 0");
}
