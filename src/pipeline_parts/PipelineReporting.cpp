#include "PipelineReports.h"

#include "CommonUtils.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <map>
#include <sstream>

namespace {
std::string statText(const std::optional<Algorithms::DescriptiveStats>& s, double Algorithms::DescriptiveStats::*member, int prec = 2) {
    return s ? CommonUtils::toFixed((*s).*member, prec) : "n/a";
}

std::vector<std::vector<std::string>> counterRows(const PipelineStatistics& stats) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(stats.entries().size());
    for (const auto& [name, value] : stats.entries()) {
        rows.push_back({CommonUtils::titleCaseKey(name), CommonUtils::withThousands(value)});
    }
    return rows;
}

std::vector<std::string> describeRow(const std::string& label, const std::optional<Algorithms::DescriptiveStats>& s) {
    using DS = Algorithms::DescriptiveStats;
    return {label,
            s ? std::to_string(s->count) : "0",
            statText(s, &DS::mean),
            statText(s, &DS::stdDev),
            statText(s, &DS::min),
            statText(s, &DS::max),
            statText(s, &DS::range)};
}

std::vector<std::vector<std::string>> groupRows(const std::vector<GroupSummary>& groups) {
    using DS = Algorithms::DescriptiveStats;
    std::vector<std::vector<std::string>> rows;
    rows.reserve(groups.size());
    for (const auto& g : groups) {
        rows.push_back({g.key,
                        std::to_string(g.count),
                        statText(g.distance, &DS::mean, 3),
                        statText(g.speed, &DS::mean),
                        statText(g.duration, &DS::mean, 1)});
    }
    return rows;
}

bool isSampleKey(const std::string& key) {
    static const char* prefixes[] = {"trip_", "pickup_", "dropoff_", "is_", "time_", "efficiency", "distance_per"};
    for (const char* p : prefixes) {
        if (key.rfind(p, 0) == 0) return true;
    }
    return false;
}
}

namespace PipelineReports {

std::string reportPathFor(const std::string& outputPath, const std::string& reportDir, const std::string& suffix) {
    namespace fs = std::filesystem;
    const fs::path out(outputPath);
    const std::string stem = out.stem().string().empty() ? "hackney" : out.stem().string();
    const fs::path dir = reportDir.empty() ? out.parent_path() : fs::path(reportDir);
    return (dir / (stem + suffix + ".md")).string();
}

std::string currentTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream os;
    os << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return os.str();
}

ReportEngine buildCleaningReport(const CleaningPipeline& cleaner,
                                 const std::string& inputPath,
                                 const std::string& outputPath,
                                 const std::string& timestamp) {
    const CleaningConfig& cfg = cleaner.config();
    const PipelineStatistics& stats = cleaner.statistics();

    ReportEngine report;
    report.addTitle("NYC Taxi Data Cleaning Report");
    report.addKeyValueList({
        {"Input file", inputPath},
        {"Output file", outputPath},
        {"Cleaning date", timestamp}
    });

    report.addTable("Cleaning Statistics", {"Counter", "Value"}, counterRows(stats));
    if (stats.get("total_records") > 0) {
        report.addParagraph("Data Quality: " + CommonUtils::toFixed(cleaner.dataQualityPercent(), 2) + "% valid records");
    }

    std::map<std::string, size_t> byFlag;
    for (const auto& record : cleaner.rejected()) ++byFlag[toString(record.validity())];
    std::vector<std::vector<std::string>> rejectionRows;
    for (const auto& [flag, count] : byFlag) {
        std::string firstRows;
        size_t listed = 0;
        for (const auto& record : cleaner.rejected()) {
            if (toString(record.validity()) != flag) continue;
            if (listed == 5) {
                firstRows += ", ...";
                break;
            }
            if (listed > 0) firstRows += ", ";
            firstRows += std::to_string(record.rowNumber());
            ++listed;
        }
        rejectionRows.push_back({flag, CommonUtils::withThousands(count), firstRows});
    }
    report.addTable("Rejected Records", {"Validity Flag", "Records", "First Source Lines"}, rejectionRows);

    report.addSection("Cleaning Assumptions");
    report.addBulletList({
        "Missing passenger_count defaulted to 1",
        "Missing store_and_fwd_flag defaulted to 'N'",
        "Missing vendor_id defaulted to 1",
        "Trip duration must be between " + std::to_string(cfg.minDurationSeconds) + " and " +
            std::to_string(cfg.maxDurationSeconds) + " seconds",
        "Passenger count must be between " + std::to_string(cfg.minPassengers) + " and " +
            std::to_string(cfg.maxPassengers),
        "Coordinates must be within the geographic bounds below",
        "Outliers detected using IQR method (" + CommonUtils::toFixed(cfg.outlierIqrMultiplier, 1) + " multiplier)"
    });

    report.addSection("Coordinate Bounds Used");
    report.addKeyValueList({
        {"min_lat", CommonUtils::toFixed(cfg.bounds.minLat, 4)},
        {"max_lat", CommonUtils::toFixed(cfg.bounds.maxLat, 4)},
        {"min_lon", CommonUtils::toFixed(cfg.bounds.minLon, 4)},
        {"max_lon", CommonUtils::toFixed(cfg.bounds.maxLon, 4)}
    });

    report.addSection("Duration Outlier Bounds");
    if (const auto& b = cleaner.outlierBounds()) {
        report.addKeyValueList({
            {"q1", CommonUtils::toFixed(b->q1, 2)},
            {"q3", CommonUtils::toFixed(b->q3, 2)},
            {"iqr", CommonUtils::toFixed(b->iqr, 2)},
            {"lower", CommonUtils::toFixed(b->lower, 2)},
            {"upper", CommonUtils::toFixed(b->upper, 2)}
        });
    } else {
        report.addParagraph("Fewer than 4 surviving records; no outlier bounds were computed.");
    }
    if (cleaner.usedSampling()) {
        report.addParagraph("Bounds computed from a seeded sample of " + CommonUtils::withThousands(cleaner.sampledCount()) +
                            " durations (seed " + std::to_string(cfg.samplingSeed) + ") and applied to every surviving record.");
    } else {
        report.addParagraph("Bounds computed from all surviving records.");
    }

    report.addTable("Algorithm Operations", {"Metric", "Value"}, {
        {"Comparisons", CommonUtils::withThousands(cleaner.operationCounters().comparisons)},
        {"Swaps", CommonUtils::withThousands(cleaner.operationCounters().swaps)}
    });
    return report;
}

ReportEngine buildFeaturesReport(const FeatureEngineer& engineer,
                                 const std::vector<TripRecord>& enriched,
                                 const InsightSummary& insights,
                                 const Algorithms::OperationCounters& insightOps,
                                 const std::string& inputPath,
                                 const std::string& outputPath,
                                 const std::string& timestamp) {
    ReportEngine report;
    report.addTitle("Feature Engineering Report");
    report.addKeyValueList({
        {"Input file", inputPath},
        {"Output file", outputPath},
        {"Processing date", timestamp}
    });

    report.addTable("Feature Statistics", {"Counter", "Value"}, counterRows(engineer.statistics()));

    report.addSection("Derived Features Created");
    report.addBulletList({
        "Trip Distance (km) - Haversine distance calculation",
        "Trip Speed (km/h) - Average speed during trip",
        "Temporal Features - Hour, day, weekend, rush hour",
        "Efficiency Metrics - Distance per minute, idle time, efficiency score",
        "Zone Classification - Borough identification",
        "Trip Patterns - Speed, distance, and duration classifications"
    });

    report.addTable("Feature Descriptions", {"Feature", "Description"}, {
        {"trip_distance_km", "Great circle distance between pickup and dropoff"},
        {"trip_speed_kmh", "Average speed calculated from distance and duration"},
        {"distance_per_minute", "Distance covered per minute of travel"},
        {"estimated_idle_time", "Estimated time spent not moving (traffic, stops)"},
        {"efficiency_score", "Trip efficiency score (0-100, higher is better)"},
        {"trip_complexity", "Ratio of actual to expected duration"},
        {"pickup_borough", "Estimated NYC borough for pickup location"},
        {"trip_type", "Intra-borough or inter-borough classification"},
        {"time_of_day", "Morning, Afternoon, Evening, or Night"},
        {"is_rush_hour", "Whether trip occurred during rush hours"},
        {"trip_patterns", "Speed, distance, and duration pattern classification"}
    });

    const PatternThresholds& t = engineer.thresholds();
    const FeatureConfig& fc = engineer.config();
    const std::string lowLabel = "P" + CommonUtils::toFixed(fc.lowPercentile, 0);
    const std::string highLabel = "P" + CommonUtils::toFixed(fc.highPercentile, 0);
    report.addTable("Pattern Thresholds", {"Metric", lowLabel, highLabel}, {
        {"Speed (km/h)", CommonUtils::toFixed(t.speedLow, 2), CommonUtils::toFixed(t.speedHigh, 2)},
        {"Distance (km)", CommonUtils::toFixed(t.distanceLow, 3), CommonUtils::toFixed(t.distanceHigh, 3)},
        {"Duration (s)", CommonUtils::toFixed(t.durationLow, 1), CommonUtils::toFixed(t.durationHigh, 1)}
    });
    report.addParagraph("Thresholds computed from " + CommonUtils::withThousands(t.basisCount) + " records" +
                        (t.outliersExcluded ? " (duration outliers excluded)." : " (duration outliers included)."));

    report.addTable("Descriptive Statistics", {"Metric", "Count", "Mean", "Std Dev", "Min", "Max", "Range"}, {
        describeRow("trip_distance_km", insights.distance),
        describeRow("trip_speed_kmh", insights.speed),
        describeRow("trip_duration", insights.duration)
    });

    const std::vector<std::string> groupHeaders = {"Group", "Trips", "Mean km", "Mean km/h", "Mean seconds"};
    report.addTable("Trips by Time of Day", groupHeaders, groupRows(insights.byTimeOfDay));
    report.addTable("Trips by Pickup Borough", groupHeaders, groupRows(insights.byPickupBorough));

    std::vector<std::vector<std::string>> vendorRows;
    for (const auto& [vendor, group] : TripInsights::groupRecordsByField(enriched, TripFields::kVendorId)) {
        vendorRows.push_back({vendor, CommonUtils::withThousands(group.size())});
    }
    report.addTable("Trips by Vendor", {"Vendor", "Trips"}, vendorRows);

    std::vector<std::vector<std::string>> fastestRows;
    for (const auto& trip : insights.fastestTrips) {
        fastestRows.push_back({trip.id,
                               std::to_string(trip.rowNumber),
                               CommonUtils::toFixed(trip.tripSpeedKmh, 2),
                               CommonUtils::toFixed(trip.tripDistanceKm, 3),
                               CommonUtils::toFixed(trip.durationSeconds, 0),
                               trip.pickupBorough + " -> " + trip.dropoffBorough});
    }
    report.addTable("Fastest Trips", {"Id", "Source Line", "km/h", "km", "Seconds", "Route"}, fastestRows);

    const Algorithms::OperationCounters& featureOps = engineer.operationCounters();
    report.addTable("Algorithm Operations", {"Stage", "Comparisons", "Swaps"}, {
        {"Pattern thresholds", CommonUtils::withThousands(featureOps.comparisons), CommonUtils::withThousands(featureOps.swaps)},
        {"Insights", CommonUtils::withThousands(insightOps.comparisons), CommonUtils::withThousands(insightOps.swaps)},
        {"Total",
         CommonUtils::withThousands(featureOps.comparisons + insightOps.comparisons),
         CommonUtils::withThousands(featureOps.swaps + insightOps.swaps)}
    });

    report.addSection("Sample Statistics");
    if (!enriched.empty()) {
        std::vector<std::pair<std::string, std::string>> sample;
        for (const auto& [key, value] : enriched.front().fields()) {
            if (isSampleKey(key)) sample.emplace_back(key, value);
        }
        report.addParagraph("Sample enhanced record:");
        report.addKeyValueList(sample);
    } else {
        report.addParagraph("No records were enriched.");
    }
    return report;
}

}
