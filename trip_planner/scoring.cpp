#include "scoring.hpp"

double score_place(const Place &place, double distance_km, const ScoringWeights &w) {
    return place.rating * w.rating_weight - distance_km * w.distance_weight;
}
