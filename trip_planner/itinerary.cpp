#include "itinerary.hpp"
#include <algorithm>
#include <numeric>
#include <utility>
#include "debug.hpp"
#include "scoring.hpp"
#include "travel.hpp"
using json = nlohmann::json;

ItineraryBuilder::ItineraryBuilder(const Location &current_location, double available_time_minutes,
                                   const PlannerConfig &config)
    : current_location_(current_location),
      available_time_minutes_(available_time_minutes),
      config_(config) {}

std::vector<ScoredPlace> ItineraryBuilder::score_candidates(const std::vector<Place> &candidates) const {
    std::vector<ScoredPlace> scored;
    scored.reserve(candidates.size());

    for (const auto &p : candidates) {
        ScoredPlace sp;
        sp.place = p;
        sp.distance_from_user = haversine_km(current_location_, p.location);
        sp.travel_time_from_user = estimate_travel_minutes(sp.distance_from_user, config_.average_speed_kmh);
        sp.score = score_place(p, sp.distance_from_user, config_.weights);
        scored.push_back(std::move(sp));
    }
    return scored;
}

// Single pass over the ranked list. Rejections do not stop the scan.
static Itinerary select_greedy(std::vector<ScoredPlace> ranked, double budget) {
    Itinerary it;
    it.available_time_minutes = budget;

    for (auto &sp : ranked) {
        double cost = sp.cost();
        if (it.total_time_used + cost <= budget) {
            it.total_time_used += cost;
            DBG("accept " << sp.place.id << " score=" << sp.score << " cost=" << cost
                << " used=" << it.total_time_used);
            it.places.push_back(std::move(sp));
        } else {
            DBG("skip   " << sp.place.id << " score=" << sp.score << " cost=" << cost);
            it.skipped.push_back(std::move(sp));
        }
    }
    return it;
}

Itinerary ItineraryBuilder::build(const std::vector<Place> &candidates) const {
    if (config_.validation == ValidationPolicy::Strict) {
        validate_location(current_location_);
        for (const auto &p : candidates) validate_place(p);
    }

    std::vector<ScoredPlace> ranked = score_candidates(candidates);

    // stable: equal scores must come out in input order
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const ScoredPlace &a, const ScoredPlace &b) { return a.score > b.score; });

    return select_greedy(std::move(ranked), available_time_minutes_);
}

ItinerarySummary summarize(const Itinerary &it) {
    ItinerarySummary s;
    s.total_locations = it.places.size();
    s.total_visit_minutes = std::accumulate(it.places.begin(), it.places.end(), 0.0,
        [](double acc, const ScoredPlace &sp) { return acc + sp.place.visit_duration_minutes; });
    s.total_travel_minutes = std::accumulate(it.places.begin(), it.places.end(), 0.0,
        [](double acc, const ScoredPlace &sp) { return acc + sp.travel_time_from_user; });
    if (!it.places.empty()) {
        double rating_sum = std::accumulate(it.places.begin(), it.places.end(), 0.0,
            [](double acc, const ScoredPlace &sp) { return acc + sp.place.rating; });
        s.average_rating = rating_sum / it.places.size();
    }
    s.remaining_minutes = std::max(0.0, it.available_time_minutes - it.total_time_used);
    return s;
}

json scored_place_to_json(const ScoredPlace &sp) {
    json j = place_to_json(sp.place);
    j["distance_from_user"] = sp.distance_from_user;
    j["travel_time_from_user"] = sp.travel_time_from_user;
    j["score"] = sp.score;
    return j;
}

json summary_to_json(const ItinerarySummary &s) {
    return {
        {"total_locations", s.total_locations},
        {"total_visit_minutes", s.total_visit_minutes},
        {"total_travel_minutes", s.total_travel_minutes},
        {"average_rating", s.average_rating}
    };
}
