#pragma once
#include "PipelineStatistics.h"
#include "TripInsights.h"
#include <string>
#include <vector>

class TerminalUI {
public:
    static void printCounterTable(const std::string& title, const PipelineStatistics& stats);
    static void printCleaningSummary(const PipelineStatistics& stats, double qualityPercent, const std::string& outputPath);
    static void printFeatureSummary(const PipelineStatistics& stats, const std::string& outputPath);

    // Per-group count and mean distance/speed/duration.
    static void printGroupTable(const std::string& title, const std::vector<GroupSummary>& groups);
    static void printFastestTrips(const std::vector<TripFeatures>& trips);
};
