#pragma once

#include "Algorithms.h"
#include "FeatureEngineer.h"
#include "TripRecord.h"

#include <optional>
#include <string>
#include <vector>

struct GroupSummary {
    std::string key;
    size_t count = 0;
    std::optional<Algorithms::DescriptiveStats> distance;
    std::optional<Algorithms::DescriptiveStats> speed;
    std::optional<Algorithms::DescriptiveStats> duration;
};

struct InsightSummary {
    std::optional<Algorithms::DescriptiveStats> distance;
    std::optional<Algorithms::DescriptiveStats> speed;
    std::optional<Algorithms::DescriptiveStats> duration;
    std::vector<GroupSummary> byTimeOfDay;
    std::vector<GroupSummary> byPickupBorough;
    std::vector<TripFeatures> fastestTrips;
};

namespace TripInsights {

/**
 * @brief Groups records by the raw value of `field`.
 * @details Records that lack the field are skipped. Key order is first-seen order.
 */
Algorithms::GroupedItems<TripRecord> groupRecordsByField(const std::vector<TripRecord>& records,
                                                         const std::string& field);

GroupSummary summarizeGroup(const std::string& key, const std::vector<TripFeatures>& trips);

/**
 * @brief Descriptive statistics, per-group summaries and the top-K fastest trips.
 * @details Trips whose duration failed to parse are left out of the duration statistics.
 */
InsightSummary summarize(const std::vector<TripFeatures>& trips,
                         size_t topK,
                         Algorithms::OperationCounters* counters = nullptr);

}
