#pragma once

#include "Algorithms.h"
#include "AutoConfig.h"
#include "PipelineStatistics.h"
#include "TripRecord.h"

#include <functional>
#include <optional>
#include <vector>

/**
 * Sequential structural cleaning of raw trip records.
 *
 * Stages run strictly in order on the survivors of the previous stage:
 * dedup, missing-value defaulting, coordinate bounds, datetime ordering,
 * duration/passenger bounds, duration outlier annotation. Rejected records
 * carry their ValidityFlag and are kept in rejected(); outliers stay in the
 * working set with OutlierFlag::DURATION_OUTLIER.
 */
class CleaningPipeline {
public:
    explicit CleaningPipeline(CleaningConfig config = {});

    /**
     * @brief Runs all stages and returns the surviving records in input order.
     * @param malformedRows Rows the loader skipped; reported only.
     * @post statistics() is reset at entry and describes this run alone.
     * @post Returned size <= records.size().
     */
    std::vector<TripRecord> run(std::vector<TripRecord> records, size_t malformedRows = 0);

    std::vector<TripRecord> removeDuplicates(std::vector<TripRecord> records);
    void fillMissingValues(std::vector<TripRecord>& records);
    std::vector<TripRecord> filterCoordinates(std::vector<TripRecord> records);
    std::vector<TripRecord> filterDatetimes(std::vector<TripRecord> records);
    std::vector<TripRecord> filterDurationAndPassengers(std::vector<TripRecord> records);

    /**
     * @brief Flags trip_duration outliers with Tukey fences.
     * @details Above largeDatasetThreshold survivors the fences come from a seeded
     *          sample of outlierSampleSize durations and are applied to every record.
     */
    void annotateOutliers(std::vector<TripRecord>& records);

    const PipelineStatistics& statistics() const noexcept { return stats_; }
    const std::vector<TripRecord>& rejected() const noexcept { return rejected_; }
    const std::optional<Algorithms::IqrBounds>& outlierBounds() const noexcept { return outlierBounds_; }
    bool usedSampling() const noexcept { return usedSampling_; }
    size_t sampledCount() const noexcept { return sampledCount_; }
    const Algorithms::OperationCounters& operationCounters() const noexcept { return ops_; }
    const CleaningConfig& config() const noexcept { return config_; }

    // Percentage of loaded records that survived, 0 when nothing was loaded.
    double dataQualityPercent() const;

private:
    CleaningConfig config_;
    PipelineStatistics stats_;
    std::vector<TripRecord> rejected_;
    std::optional<Algorithms::IqrBounds> outlierBounds_;
    bool usedSampling_ = false;
    size_t sampledCount_ = 0;
    Algorithms::OperationCounters ops_;

    void resetRunState();
    std::vector<TripRecord> filterStage(std::vector<TripRecord> records,
                                        const std::function<bool(TripRecord&)>& accept,
                                        ValidityFlag rejectFlag,
                                        const char* counter);
    void log(const std::string& message) const;
};
