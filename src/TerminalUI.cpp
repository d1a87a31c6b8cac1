#include "TerminalUI.h"
#include "CommonUtils.h"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace {
constexpr const char* kRule = "============================================================================";

double meanOrZero(const std::optional<Algorithms::DescriptiveStats>& stats) {
    return stats ? stats->mean : 0.0;
}
}

void TerminalUI::printCounterTable(const std::string& title, const PipelineStatistics& stats) {
    size_t maxNameLen = 20;
    for (const auto& [name, value] : stats.entries()) maxNameLen = std::max(maxNameLen, name.length());
    const int w = static_cast<int>(maxNameLen) + 2;

    std::cout << "\n" << kRule << "\n " << title << "\n" << kRule << "\n";
    for (const auto& [name, value] : stats.entries()) {
        std::cout << std::left << std::setw(w) << CommonUtils::titleCaseKey(name)
                  << std::right << std::setw(14) << CommonUtils::withThousands(value) << "\n";
    }
    std::cout << kRule << "\n";
}

void TerminalUI::printCleaningSummary(const PipelineStatistics& stats, double qualityPercent, const std::string& outputPath) {
    std::cout << "\n" << kRule << "\n DATA CLEANING COMPLETED\n" << kRule << "\n";
    std::cout << "Total records processed: " << CommonUtils::withThousands(stats.get("total_records")) << "\n"
              << "Valid records: " << CommonUtils::withThousands(stats.get("valid_records")) << "\n"
              << "Invalid records: " << CommonUtils::withThousands(stats.get("invalid_records")) << "\n"
              << "Data quality: " << CommonUtils::toFixed(qualityPercent, 2) << "%\n"
              << "Cleaned data saved to: " << outputPath << "\n";
}

void TerminalUI::printFeatureSummary(const PipelineStatistics& stats, const std::string& outputPath) {
    std::cout << "\n" << kRule << "\n FEATURE ENGINEERING COMPLETED\n" << kRule << "\n";
    std::cout << "Records processed: " << CommonUtils::withThousands(stats.get("records_processed")) << "\n"
              << "Features created: " << CommonUtils::withThousands(stats.get("features_created")) << "\n"
              << "Enhanced data saved to: " << outputPath << "\n";
}

void TerminalUI::printGroupTable(const std::string& title, const std::vector<GroupSummary>& groups) {
    size_t maxKeyLen = 14;
    for (const auto& g : groups) maxKeyLen = std::max(maxKeyLen, g.key.length());
    const int w = static_cast<int>(maxKeyLen) + 2;

    std::cout << "\n" << kRule << "\n " << title << "\n" << kRule << "\n";
    std::cout << std::left << std::setw(w) << "Group"
              << std::right << std::setw(10) << "Trips"
              << std::setw(14) << "Mean km"
              << std::setw(14) << "Mean km/h"
              << std::setw(14) << "Mean sec" << "\n";
    std::cout << std::string(static_cast<size_t>(w) + 52, '-') << "\n";
    for (const auto& g : groups) {
        std::cout << std::left << std::setw(w) << g.key
                  << std::right << std::setw(10) << g.count
                  << std::fixed << std::setprecision(2)
                  << std::setw(14) << meanOrZero(g.distance)
                  << std::setw(14) << meanOrZero(g.speed)
                  << std::setw(14) << meanOrZero(g.duration) << "\n";
    }
    std::cout << kRule << "\n";
}

void TerminalUI::printFastestTrips(const std::vector<TripFeatures>& trips) {
    if (trips.empty()) return;
    std::cout << "\n[Hackney][Insights] Fastest trips:\n";
    for (const auto& t : trips) {
        std::cout << "        -> " << std::left << std::setw(14) << (t.id.empty() ? "row " + std::to_string(t.rowNumber) : t.id)
                  << std::right << std::fixed << std::setprecision(2)
                  << std::setw(10) << t.tripSpeedKmh << " km/h"
                  << std::setprecision(3) << std::setw(10) << t.tripDistanceKm << " km"
                  << "  " << t.pickupBorough << " -> " << t.dropoffBorough << "\n";
    }
}
