#pragma once
#include <vector>
#include "nlohmann/json.hpp"
#include "config.hpp"
#include "geo.hpp"
#include "places.hpp"

struct ScoredPlace {
    Place place;
    double distance_from_user;    // km
    double travel_time_from_user; // minutes
    double score;

    // minutes charged against the budget
    double cost() const { return travel_time_from_user + place.visit_duration_minutes; }
};

struct Itinerary {
    std::vector<ScoredPlace> places;  // accepted, highest score first
    std::vector<ScoredPlace> skipped; // did not fit, in ranked order
    double total_time_used = 0.0;
    double available_time_minutes = 0.0;
};

struct ItinerarySummary {
    std::size_t total_locations = 0;
    double total_visit_minutes = 0.0;
    double total_travel_minutes = 0.0;
    double average_rating = 0.0;
    double remaining_minutes = 0.0;
};

// Picks places for one planning request.
//
// Candidates are ranked by score (stable, so ties keep their input order) and
// then scanned once: a place is taken if its travel + visit time still fits in
// what is left of the budget, otherwise it is skipped and the scan goes on.
// This is a greedy heuristic, not a knapsack solver. It never revisits a
// decision, so it can leave budget unused that another combination would fill.
class ItineraryBuilder {
public:
    ItineraryBuilder(const Location &current_location, double available_time_minutes,
                     const PlannerConfig &config = {});

    // One ScoredPlace per candidate, in input order.
    std::vector<ScoredPlace> score_candidates(const std::vector<Place> &candidates) const;

    // Throws InvalidPlaceError under ValidationPolicy::Strict.
    Itinerary build(const std::vector<Place> &candidates) const;

    const Location &current_location() const { return current_location_; }
    double available_time_minutes() const { return available_time_minutes_; }

private:
    Location current_location_;
    double available_time_minutes_;
    PlannerConfig config_;
};

ItinerarySummary summarize(const Itinerary &it);

nlohmann::json scored_place_to_json(const ScoredPlace &sp);
nlohmann::json summary_to_json(const ItinerarySummary &s);
