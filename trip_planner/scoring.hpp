#pragma once
#include "places.hpp"

constexpr double DEFAULT_RATING_WEIGHT = 10.0;
constexpr double DEFAULT_DISTANCE_WEIGHT = 2.0;

struct ScoringWeights {
    double rating_weight = DEFAULT_RATING_WEIGHT;
    double distance_weight = DEFAULT_DISTANCE_WEIGHT;
};

// score = rating * rating_weight - distance_km * distance_weight
//
// Neither term is normalized, so scores are unbounded and how much the
// distance term matters depends on how spread out the candidates are.
// With the default weights one extra rating star is worth 5 km.
double score_place(const Place &place, double distance_km, const ScoringWeights &w = {});
