#include "requests.hpp"
#include <vector>
#include "itinerary.hpp"
#include "places.hpp"
using json = nlohmann::json;

json process_request(const json &request, const PlannerConfig &cfg) {
    json result;
    result["id"] = (request.is_object() && request.contains("id")) ? request["id"] : json();

    try {
        if (!request.is_object() || !request.contains("current_location"))
            throw MissingFieldError("current_location");
        if (!request.contains("available_time_minutes"))
            throw MissingFieldError("available_time_minutes");

        Location here = location_from_json(request["current_location"]);
        double budget = request["available_time_minutes"].get<double>();
        if (!request.contains("places"))
            throw MissingFieldError("places");
        std::vector<Place> candidates = places_from_json(request["places"]);

        ItineraryBuilder builder(here, budget, cfg);
        Itinerary it = builder.build(candidates);
        ItinerarySummary summary = summarize(it);

        result["itinerary"] = json::array();
        for (const auto &sp : it.places) result["itinerary"].push_back(scored_place_to_json(sp));

        result["skipped"] = json::array();
        for (const auto &sp : it.skipped) result["skipped"].push_back(sp.place.id);

        result["total_time_used"] = it.total_time_used;
        result["remaining_time"] = summary.remaining_minutes;
        result["summary"] = summary_to_json(summary);

    } catch (const std::exception &e) {
        json failed;
        failed["id"] = result["id"];
        failed["error"] = e.what();
        return failed;
    }

    return result;
}
