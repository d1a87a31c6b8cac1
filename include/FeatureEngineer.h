#pragma once

#include "Algorithms.h"
#include "AutoConfig.h"
#include "PipelineStatistics.h"
#include "TripRecord.h"

#include <string>
#include <vector>

/**
 * Typed view of the derived columns of one enriched record.
 * Numeric members hold the same rounded values written to the record fields.
 */
struct TripFeatures {
    size_t rowNumber = 0;
    std::string id;
    double durationSeconds = 0.0;
    bool durationValid = false;
    OutlierFlag outlier = OutlierFlag::NORMAL;

    double tripDistanceKm = 0.0;
    double tripSpeedKmh = 0.0;

    int pickupHour = 0;
    std::string timeOfDay = "Unknown";
    std::string dayOfWeek = "Unknown";
    bool isWeekend = false;
    int pickupMonth = 1;
    bool isRushHour = false;

    double distancePerMinute = 0.0;
    double estimatedIdleTime = 0.0;
    double efficiencyScore = 0.0;
    double tripComplexity = 1.0;

    std::string pickupBorough = "Unknown";
    std::string dropoffBorough = "Unknown";
    std::string tripType = "Unknown";
    std::string tripPatterns = "Normal";
};

struct PatternThresholds {
    double speedLow = 0.0;
    double speedHigh = 0.0;
    double distanceLow = 0.0;
    double distanceHigh = 0.0;
    double durationLow = 0.0;
    double durationHigh = 0.0;
    size_t basisCount = 0;
    bool outliersExcluded = false;
};

struct BoroughCenter {
    const char* name;
    double lat;
    double lon;
};

class FeatureEngineer {
public:
    explicit FeatureEngineer(FeatureConfig config = {});

    /**
     * @brief Appends every derived column to each record and returns the typed features.
     * @details Stages: distance, speed, temporal, efficiency, zones, patterns. Each stage
     *          reads the rounded values stored by earlier stages. A field that fails to
     *          parse yields the documented default for the affected features only.
     * @post result.size() == records.size() and result[i] describes records[i].
     * @post statistics() is reset at entry.
     */
    std::vector<TripFeatures> run(std::vector<TripRecord>& records);

    // Derived column names in output order.
    static const std::vector<std::string>& derivedColumns();
    static const std::vector<BoroughCenter>& boroughCenters();
    static std::string nearestBorough(double lat, double lon);
    static const char* timeOfDayLabel(int hour);

    /**
     * @brief Pattern tags for one trip, joined with ';', or "Normal" when none apply.
     */
    static std::string classifyPatterns(double speedKmh,
                                        double distanceKm,
                                        double durationSeconds,
                                        const PatternThresholds& thresholds,
                                        const FeatureConfig& config);

    const PipelineStatistics& statistics() const noexcept { return stats_; }
    const PatternThresholds& thresholds() const noexcept { return thresholds_; }
    const Algorithms::OperationCounters& operationCounters() const noexcept { return ops_; }
    const FeatureConfig& config() const noexcept { return config_; }

private:
    FeatureConfig config_;
    PipelineStatistics stats_;
    PatternThresholds thresholds_;
    Algorithms::OperationCounters ops_;

    void computeDistance(TripRecord& record, TripFeatures& features);
    void computeSpeed(TripRecord& record, TripFeatures& features);
    void computeTemporal(TripRecord& record, TripFeatures& features);
    void computeEfficiency(TripRecord& record, TripFeatures& features);
    void classifyZones(TripRecord& record, TripFeatures& features);
    void computeThresholds(const std::vector<TripFeatures>& features);
    void log(const std::string& message) const;
};
