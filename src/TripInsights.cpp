#include "TripInsights.h"

#include <utility>

namespace TripInsights {

Algorithms::GroupedItems<TripRecord> groupRecordsByField(const std::vector<TripRecord>& records,
                                                         const std::string& field) {
    std::vector<TripRecord> present;
    present.reserve(records.size());
    for (const auto& record : records) {
        if (record.has(field)) present.push_back(record);
    }
    return Algorithms::groupBy(present, [&field](const TripRecord& r) { return r.get(field); });
}

GroupSummary summarizeGroup(const std::string& key, const std::vector<TripFeatures>& trips) {
    std::vector<double> distances;
    std::vector<double> speeds;
    std::vector<double> durations;
    distances.reserve(trips.size());
    speeds.reserve(trips.size());
    for (const auto& t : trips) {
        distances.push_back(t.tripDistanceKm);
        speeds.push_back(t.tripSpeedKmh);
        if (t.durationValid) durations.push_back(t.durationSeconds);
    }

    GroupSummary summary;
    summary.key = key;
    summary.count = trips.size();
    summary.distance = Algorithms::describe(distances);
    summary.speed = Algorithms::describe(speeds);
    summary.duration = Algorithms::describe(durations);
    return summary;
}

InsightSummary summarize(const std::vector<TripFeatures>& trips,
                         size_t topK,
                         Algorithms::OperationCounters* counters) {
    InsightSummary out;
    const GroupSummary overall = summarizeGroup("all", trips);
    out.distance = overall.distance;
    out.speed = overall.speed;
    out.duration = overall.duration;

    for (const auto& [key, group] : Algorithms::groupBy(trips, [](const TripFeatures& t) { return t.timeOfDay; })) {
        out.byTimeOfDay.push_back(summarizeGroup(key, group));
    }
    for (const auto& [key, group] : Algorithms::groupBy(trips, [](const TripFeatures& t) { return t.pickupBorough; })) {
        out.byPickupBorough.push_back(summarizeGroup(key, group));
    }

    out.fastestTrips = Algorithms::topK(trips, topK, [](const TripFeatures& t) { return t.tripSpeedKmh; }, counters);
    return out;
}

}
