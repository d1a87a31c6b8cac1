#include "CleaningPipeline.h"

#include "CommonUtils.h"
#include "DateTimeUtils.h"

#include <iostream>
#include <random>
#include <string>
#include <unordered_set>
#include <utility>

namespace {
PipelineStatistics makeCleaningStatistics() {
    return PipelineStatistics{
        "total_records",
        "valid_records",
        "invalid_records",
        "duplicates_removed",
        "missing_values_fixed",
        "passenger_count_defaulted",
        "store_and_fwd_flag_defaulted",
        "vendor_id_defaulted",
        "outliers_detected",
        "coordinate_errors",
        "datetime_errors",
        "duration_errors",
        "malformed_rows"
    };
}

std::string dedupKey(const TripRecord& record) {
    std::string key;
    for (const char* field : {TripFields::kPickupDatetime,
                              TripFields::kDropoffDatetime,
                              TripFields::kPickupLongitude,
                              TripFields::kPickupLatitude,
                              TripFields::kTripDuration}) {
        key += record.get(field);
        key.push_back('\x1f');
    }
    return key;
}

bool pointInside(const TripRecord& record, const char* latField, const char* lonField, const GeoBounds& bounds) {
    double lat = 0.0;
    double lon = 0.0;
    if (!CommonUtils::parseDouble(record.get(latField), lat)) return false;
    if (!CommonUtils::parseDouble(record.get(lonField), lon)) return false;
    return bounds.contains(lat, lon);
}
}

CleaningPipeline::CleaningPipeline(CleaningConfig config)
    : config_(std::move(config)), stats_(makeCleaningStatistics()) {}

void CleaningPipeline::log(const std::string& message) const {
    if (config_.verbose) std::cout << "[Hackney][Cleaning] " << message << "\n";
}

void CleaningPipeline::resetRunState() {
    stats_.reset();
    rejected_.clear();
    outlierBounds_.reset();
    usedSampling_ = false;
    sampledCount_ = 0;
    ops_.reset();
}

std::vector<TripRecord> CleaningPipeline::run(std::vector<TripRecord> records, size_t malformedRows) {
    resetRunState();
    stats_.set("total_records", records.size());
    stats_.set("malformed_rows", malformedRows);
    log("Starting cleaning of " + CommonUtils::withThousands(records.size()) + " records");

    records = removeDuplicates(std::move(records));
    fillMissingValues(records);
    records = filterCoordinates(std::move(records));
    records = filterDatetimes(std::move(records));
    records = filterDurationAndPassengers(std::move(records));
    annotateOutliers(records);

    stats_.set("valid_records", records.size());
    stats_.set("invalid_records", stats_.get("total_records") - records.size());
    log("Kept " + CommonUtils::withThousands(records.size()) + " of " +
        CommonUtils::withThousands(stats_.get("total_records")) + " records (" +
        CommonUtils::toFixed(dataQualityPercent(), 2) + "% valid)");
    return records;
}

double CleaningPipeline::dataQualityPercent() const {
    const size_t total = stats_.get("total_records");
    if (total == 0) return 0.0;
    return 100.0 * static_cast<double>(stats_.get("valid_records")) / static_cast<double>(total);
}

std::vector<TripRecord> CleaningPipeline::filterStage(std::vector<TripRecord> records,
                                                      const std::function<bool(TripRecord&)>& accept,
                                                      ValidityFlag rejectFlag,
                                                      const char* counter) {
    std::vector<TripRecord> kept;
    kept.reserve(records.size());
    for (auto& record : records) {
        if (accept(record)) {
            kept.push_back(std::move(record));
            continue;
        }
        record.markInvalid(rejectFlag);
        stats_.increment(counter);
        rejected_.push_back(std::move(record));
    }
    return kept;
}

std::vector<TripRecord> CleaningPipeline::removeDuplicates(std::vector<TripRecord> records) {
    std::unordered_set<std::string> seen;
    seen.reserve(records.size());
    std::vector<TripRecord> kept = filterStage(
        std::move(records),
        [&seen](TripRecord& record) { return seen.insert(dedupKey(record)).second; },
        ValidityFlag::DUPLICATE,
        "duplicates_removed");
    log("Removed " + CommonUtils::withThousands(stats_.get("duplicates_removed")) + " duplicates");
    return kept;
}

void CleaningPipeline::fillMissingValues(std::vector<TripRecord>& records) {
    struct DefaultRule {
        const char* field;
        const char* value;
        const char* counter;
    };
    static const DefaultRule rules[] = {
        {TripFields::kPassengerCount, "1", "passenger_count_defaulted"},
        {TripFields::kStoreAndFwdFlag, "N", "store_and_fwd_flag_defaulted"},
        {TripFields::kVendorId, "1", "vendor_id_defaulted"}
    };

    for (auto& record : records) {
        for (const auto& rule : rules) {
            if (!record.isMissing(rule.field)) continue;
            record.set(rule.field, rule.value);
            stats_.increment(rule.counter);
            stats_.increment("missing_values_fixed");
        }
    }
    log("Fixed " + CommonUtils::withThousands(stats_.get("missing_values_fixed")) + " missing values");
}

std::vector<TripRecord> CleaningPipeline::filterCoordinates(std::vector<TripRecord> records) {
    const GeoBounds bounds = config_.bounds;
    std::vector<TripRecord> kept = filterStage(
        std::move(records),
        [&bounds](TripRecord& record) {
            return pointInside(record, TripFields::kPickupLatitude, TripFields::kPickupLongitude, bounds) &&
                   pointInside(record, TripFields::kDropoffLatitude, TripFields::kDropoffLongitude, bounds);
        },
        ValidityFlag::INVALID_COORDINATES,
        "coordinate_errors");
    log("Removed " + CommonUtils::withThousands(stats_.get("coordinate_errors")) + " records with invalid coordinates");
    return kept;
}

std::vector<TripRecord> CleaningPipeline::filterDatetimes(std::vector<TripRecord> records) {
    std::vector<TripRecord> kept = filterStage(
        std::move(records),
        [](TripRecord& record) {
            DateTimeUtils::CivilDateTime pickup;
            DateTimeUtils::CivilDateTime dropoff;
            if (!DateTimeUtils::parseTimestamp(record.get(TripFields::kPickupDatetime), pickup)) return false;
            if (!DateTimeUtils::parseTimestamp(record.get(TripFields::kDropoffDatetime), dropoff)) return false;
            const int64_t elapsed = DateTimeUtils::toUnixSeconds(dropoff) - DateTimeUtils::toUnixSeconds(pickup);
            if (elapsed <= 0) return false;
            record.set(TripFields::kCalculatedDuration, std::to_string(elapsed));
            return true;
        },
        ValidityFlag::INVALID_DATETIME,
        "datetime_errors");
    log("Removed " + CommonUtils::withThousands(stats_.get("datetime_errors")) + " records with invalid datetime");
    return kept;
}

std::vector<TripRecord> CleaningPipeline::filterDurationAndPassengers(std::vector<TripRecord> records) {
    const CleaningConfig& cfg = config_;
    std::vector<TripRecord> kept = filterStage(
        std::move(records),
        [&cfg](TripRecord& record) {
            int64_t duration = 0;
            int64_t passengers = 0;
            if (!CommonUtils::parseInt(record.get(TripFields::kTripDuration), duration)) return false;
            if (!CommonUtils::parseInt(record.get(TripFields::kPassengerCount), passengers)) return false;
            return duration >= cfg.minDurationSeconds && duration <= cfg.maxDurationSeconds &&
                   passengers >= cfg.minPassengers && passengers <= cfg.maxPassengers;
        },
        ValidityFlag::INVALID_DURATION_OR_PASSENGERS,
        "duration_errors");
    log("Removed " + CommonUtils::withThousands(stats_.get("duration_errors")) + " records with invalid duration/passengers");
    return kept;
}

void CleaningPipeline::annotateOutliers(std::vector<TripRecord>& records) {
    std::vector<double> durations;
    durations.reserve(records.size());
    for (const auto& record : records) {
        durations.push_back(CommonUtils::parseDoubleOr(record.get(TripFields::kTripDuration), 0.0));
    }

    std::vector<size_t> outlierIndices;
    if (durations.size() > config_.largeDatasetThreshold) {
        log("Large dataset detected (" + CommonUtils::withThousands(durations.size()) +
            " records). Using sampling for outlier detection...");
        std::mt19937 rng(config_.samplingSeed);
        const std::vector<double> sample =
            Algorithms::sampleWithoutReplacement(durations, config_.outlierSampleSize, rng);
        usedSampling_ = true;
        sampledCount_ = sample.size();
        outlierBounds_ = Algorithms::detectOutliersIQR(sample, config_.outlierIqrMultiplier, &ops_).bounds;
        if (outlierBounds_) outlierIndices = Algorithms::indicesOutside(durations, *outlierBounds_);
    } else {
        Algorithms::IqrOutlierResult result =
            Algorithms::detectOutliersIQR(durations, config_.outlierIqrMultiplier, &ops_);
        outlierBounds_ = result.bounds;
        outlierIndices = std::move(result.outlierIndices);
    }

    for (auto& record : records) record.setOutlier(OutlierFlag::NORMAL);
    for (size_t idx : outlierIndices) records[idx].setOutlier(OutlierFlag::DURATION_OUTLIER);
    stats_.set("outliers_detected", outlierIndices.size());

    log("Detected " + CommonUtils::withThousands(outlierIndices.size()) + " outliers");
    if (outlierBounds_) {
        log("Outlier bounds: q1=" + CommonUtils::toFixed(outlierBounds_->q1, 2) +
            " q3=" + CommonUtils::toFixed(outlierBounds_->q3, 2) +
            " iqr=" + CommonUtils::toFixed(outlierBounds_->iqr, 2) +
            " lower=" + CommonUtils::toFixed(outlierBounds_->lower, 2) +
            " upper=" + CommonUtils::toFixed(outlierBounds_->upper, 2));
    }
}
