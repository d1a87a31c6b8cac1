#include "FeatureEngineer.h"

#include "CommonUtils.h"
#include "DateTimeUtils.h"

#include <algorithm>
#include <iostream>
#include <limits>
#include <utility>

namespace {
PipelineStatistics makeFeatureStatistics() {
    return PipelineStatistics{
        "records_processed",
        "features_created",
        "distance_calculations",
        "time_features",
        "efficiency_metrics",
        "zone_classifications",
        "pattern_classifications",
        "distance_fallbacks",
        "time_fallbacks",
        "efficiency_fallbacks",
        "zone_fallbacks",
        "pattern_fallbacks"
    };
}

const char* boolText(bool value) {
    return value ? "True" : "False";
}

bool parsePoint(const TripRecord& record, const char* latField, const char* lonField, double& lat, double& lon) {
    return CommonUtils::parseDouble(record.get(latField), lat) &&
           CommonUtils::parseDouble(record.get(lonField), lon);
}
}

FeatureEngineer::FeatureEngineer(FeatureConfig config)
    : config_(std::move(config)), stats_(makeFeatureStatistics()) {}

void FeatureEngineer::log(const std::string& message) const {
    if (config_.verbose) std::cout << "[Hackney][Features] " << message << "\n";
}

const std::vector<std::string>& FeatureEngineer::derivedColumns() {
    static const std::vector<std::string> columns = {
        "trip_distance_km", "trip_speed_kmh",
        "pickup_hour", "time_of_day", "day_of_week", "is_weekend", "pickup_month", "is_rush_hour",
        "distance_per_minute", "estimated_idle_time", "efficiency_score", "trip_complexity",
        "pickup_borough", "dropoff_borough", "trip_type",
        "trip_patterns"
    };
    return columns;
}

const std::vector<BoroughCenter>& FeatureEngineer::boroughCenters() {
    static const std::vector<BoroughCenter> centers = {
        {"Manhattan", 40.7831, -73.9712},
        {"Brooklyn", 40.6782, -73.9442},
        {"Queens", 40.7282, -73.7949},
        {"Bronx", 40.8448, -73.8648},
        {"Staten Island", 40.5795, -74.1502}
    };
    return centers;
}

std::string FeatureEngineer::nearestBorough(double lat, double lon) {
    const auto& centers = boroughCenters();
    std::string closest = centers.front().name;
    double best = std::numeric_limits<double>::infinity();
    for (const auto& center : centers) {
        const double d = Algorithms::haversineKm(lat, lon, center.lat, center.lon);
        if (d < best) {
            best = d;
            closest = center.name;
        }
    }
    return closest;
}

const char* FeatureEngineer::timeOfDayLabel(int hour) {
    if (hour >= 5 && hour < 12) return "Morning";
    if (hour >= 12 && hour < 17) return "Afternoon";
    if (hour >= 17 && hour < 21) return "Evening";
    return "Night";
}

std::string FeatureEngineer::classifyPatterns(double speedKmh,
                                              double distanceKm,
                                              double durationSeconds,
                                              const PatternThresholds& t,
                                              const FeatureConfig& config) {
    std::vector<const char*> tags;
    if (speedKmh < t.speedLow) {
        tags.push_back("Slow");
    } else if (speedKmh > t.speedHigh) {
        tags.push_back("Fast");
    }
    if (distanceKm < t.distanceLow) {
        tags.push_back("Short");
    } else if (distanceKm > t.distanceHigh) {
        tags.push_back("Long");
    }
    if (durationSeconds < t.durationLow) {
        tags.push_back("Quick");
    } else if (durationSeconds > t.durationHigh) {
        tags.push_back("Extended");
    }
    if (speedKmh < config.trafficSpeedKmh) tags.push_back("Traffic");
    if (distanceKm < config.localDistanceKm) tags.push_back("Local");
    if (durationSeconds > config.journeyDurationSeconds) tags.push_back("Journey");

    if (tags.empty()) return "Normal";
    std::string joined;
    for (size_t i = 0; i < tags.size(); ++i) {
        if (i > 0) joined.push_back(';');
        joined += tags[i];
    }
    return joined;
}

std::vector<TripFeatures> FeatureEngineer::run(std::vector<TripRecord>& records) {
    stats_.reset();
    ops_.reset();
    thresholds_ = PatternThresholds{};

    std::vector<TripFeatures> features(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        TripFeatures& f = features[i];
        f.rowNumber = records[i].rowNumber();
        f.id = records[i].get(TripFields::kId);
        f.outlier = records[i].outlier();
        f.durationValid = CommonUtils::parseDouble(records[i].get(TripFields::kTripDuration), f.durationSeconds);
        if (!f.durationValid) f.durationSeconds = 0.0;
        stats_.increment("records_processed");
    }
    log("Engineering features for " + CommonUtils::withThousands(records.size()) + " records");

    log("Calculating trip distances...");
    for (size_t i = 0; i < records.size(); ++i) computeDistance(records[i], features[i]);
    log("Calculated distances for " + CommonUtils::withThousands(stats_.get("distance_calculations")) + " trips");

    log("Calculating trip speeds...");
    for (size_t i = 0; i < records.size(); ++i) computeSpeed(records[i], features[i]);

    log("Extracting temporal features...");
    for (size_t i = 0; i < records.size(); ++i) computeTemporal(records[i], features[i]);

    log("Calculating efficiency metrics...");
    for (size_t i = 0; i < records.size(); ++i) computeEfficiency(records[i], features[i]);

    log("Classifying trip zones...");
    for (size_t i = 0; i < records.size(); ++i) classifyZones(records[i], features[i]);

    log("Detecting trip patterns...");
    computeThresholds(features);
    for (size_t i = 0; i < records.size(); ++i) {
        TripFeatures& f = features[i];
        if (!f.durationValid) {
            f.tripPatterns = "Unknown";
            stats_.increment("pattern_fallbacks");
        } else {
            f.tripPatterns = classifyPatterns(f.tripSpeedKmh, f.tripDistanceKm, f.durationSeconds, thresholds_, config_);
            stats_.increment("pattern_classifications");
            stats_.increment("features_created");
        }
        records[i].set("trip_patterns", f.tripPatterns);
    }

    log("Created " + CommonUtils::withThousands(stats_.get("features_created")) + " feature values");
    return features;
}

void FeatureEngineer::computeDistance(TripRecord& record, TripFeatures& f) {
    double pickupLat = 0.0;
    double pickupLon = 0.0;
    double dropoffLat = 0.0;
    double dropoffLon = 0.0;
    if (parsePoint(record, TripFields::kPickupLatitude, TripFields::kPickupLongitude, pickupLat, pickupLon) &&
        parsePoint(record, TripFields::kDropoffLatitude, TripFields::kDropoffLongitude, dropoffLat, dropoffLon)) {
        f.tripDistanceKm = CommonUtils::roundTo(Algorithms::haversineKm(pickupLat, pickupLon, dropoffLat, dropoffLon), 3);
        stats_.increment("distance_calculations");
        stats_.increment("features_created");
    } else {
        f.tripDistanceKm = 0.0;
        stats_.increment("distance_fallbacks");
    }
    record.set("trip_distance_km", CommonUtils::toFixed(f.tripDistanceKm, 3));
}

void FeatureEngineer::computeSpeed(TripRecord& record, TripFeatures& f) {
    f.tripSpeedKmh = 0.0;
    if (f.durationSeconds > 0.0) {
        f.tripSpeedKmh = CommonUtils::roundTo(f.tripDistanceKm / (f.durationSeconds / 3600.0), 2);
    }
    stats_.increment("features_created");
    record.set("trip_speed_kmh", CommonUtils::toFixed(f.tripSpeedKmh, 2));
}

void FeatureEngineer::computeTemporal(TripRecord& record, TripFeatures& f) {
    DateTimeUtils::CivilDateTime pickup;
    if (DateTimeUtils::parseTimestamp(record.get(TripFields::kPickupDatetime), pickup)) {
        const int dow = DateTimeUtils::dayOfWeek(pickup);
        f.pickupHour = pickup.hour;
        f.timeOfDay = timeOfDayLabel(pickup.hour);
        f.dayOfWeek = DateTimeUtils::dayName(dow);
        f.isWeekend = dow >= 5;
        f.pickupMonth = pickup.month;
        const bool rushWindow = (f.pickupHour >= 7 && f.pickupHour <= 9) || (f.pickupHour >= 17 && f.pickupHour <= 19);
        f.isRushHour = rushWindow && !f.isWeekend;
        stats_.increment("time_features", 6);
        stats_.increment("features_created", 6);
    } else {
        f.pickupHour = 0;
        f.timeOfDay = "Unknown";
        f.dayOfWeek = "Unknown";
        f.isWeekend = false;
        f.pickupMonth = 1;
        f.isRushHour = false;
        stats_.increment("time_fallbacks");
    }

    record.set("pickup_hour", std::to_string(f.pickupHour));
    record.set("time_of_day", f.timeOfDay);
    record.set("day_of_week", f.dayOfWeek);
    record.set("is_weekend", boolText(f.isWeekend));
    record.set("pickup_month", std::to_string(f.pickupMonth));
    record.set("is_rush_hour", boolText(f.isRushHour));
}

void FeatureEngineer::computeEfficiency(TripRecord& record, TripFeatures& f) {
    if (f.durationValid) {
        const double duration = f.durationSeconds;
        const double distance = f.tripDistanceKm;
        const double speed = f.tripSpeedKmh;

        const double minutes = duration / 60.0;
        f.distancePerMinute = minutes > 0.0 ? CommonUtils::roundTo(distance / minutes, 4) : 0.0;

        if (speed > 0.0) {
            const double movingSeconds = distance / speed * 3600.0;
            f.estimatedIdleTime = CommonUtils::roundTo(std::max(0.0, duration - movingSeconds), 0);
        } else {
            f.estimatedIdleTime = CommonUtils::roundTo(duration, 0);
        }

        f.efficiencyScore = speed > 0.0
            ? CommonUtils::roundTo(std::min(100.0, speed / config_.efficiencyReferenceSpeedKmh * 100.0), 1)
            : 0.0;

        if (distance > 0.0 && duration > 0.0) {
            const double expectedSeconds = distance / config_.expectedCitySpeedKmh * 3600.0;
            f.tripComplexity = CommonUtils::roundTo(duration / expectedSeconds, 2);
        } else {
            f.tripComplexity = 1.0;
        }

        stats_.increment("efficiency_metrics", 4);
        stats_.increment("features_created", 4);
    } else {
        f.distancePerMinute = 0.0;
        f.estimatedIdleTime = 0.0;
        f.efficiencyScore = 0.0;
        f.tripComplexity = 1.0;
        stats_.increment("efficiency_fallbacks");
    }

    record.set("distance_per_minute", CommonUtils::toFixed(f.distancePerMinute, 4));
    record.set("estimated_idle_time", CommonUtils::toFixed(f.estimatedIdleTime, 0));
    record.set("efficiency_score", CommonUtils::toFixed(f.efficiencyScore, 1));
    record.set("trip_complexity", CommonUtils::toFixed(f.tripComplexity, 2));
}

void FeatureEngineer::classifyZones(TripRecord& record, TripFeatures& f) {
    double pickupLat = 0.0;
    double pickupLon = 0.0;
    double dropoffLat = 0.0;
    double dropoffLon = 0.0;
    if (parsePoint(record, TripFields::kPickupLatitude, TripFields::kPickupLongitude, pickupLat, pickupLon) &&
        parsePoint(record, TripFields::kDropoffLatitude, TripFields::kDropoffLongitude, dropoffLat, dropoffLon)) {
        f.pickupBorough = nearestBorough(pickupLat, pickupLon);
        f.dropoffBorough = nearestBorough(dropoffLat, dropoffLon);
        f.tripType = f.pickupBorough == f.dropoffBorough ? "Intra-borough" : "Inter-borough";
        stats_.increment("zone_classifications");
        stats_.increment("features_created", 3);
    } else {
        f.pickupBorough = "Unknown";
        f.dropoffBorough = "Unknown";
        f.tripType = "Unknown";
        stats_.increment("zone_fallbacks");
    }

    record.set("pickup_borough", f.pickupBorough);
    record.set("dropoff_borough", f.dropoffBorough);
    record.set("trip_type", f.tripType);
}

void FeatureEngineer::computeThresholds(const std::vector<TripFeatures>& features) {
    const auto collect = [&features](bool normalOnly, std::vector<double>& speeds,
                                     std::vector<double>& distances, std::vector<double>& durations) {
        speeds.clear();
        distances.clear();
        durations.clear();
        for (const auto& f : features) {
            if (!f.durationValid) continue;
            if (normalOnly && f.outlier != OutlierFlag::NORMAL) continue;
            speeds.push_back(f.tripSpeedKmh);
            distances.push_back(f.tripDistanceKm);
            durations.push_back(f.durationSeconds);
        }
    };

    std::vector<double> speeds;
    std::vector<double> distances;
    std::vector<double> durations;
    bool excluded = false;
    if (config_.patternThresholdsExcludeOutliers) {
        collect(true, speeds, distances, durations);
        excluded = !speeds.empty();
    }
    if (!excluded) collect(false, speeds, distances, durations);

    const std::vector<double> ps = {config_.lowPercentile, config_.highPercentile};
    const std::vector<double> speedP = Algorithms::percentiles(speeds, ps, &ops_);
    const std::vector<double> distanceP = Algorithms::percentiles(distances, ps, &ops_);
    const std::vector<double> durationP = Algorithms::percentiles(durations, ps, &ops_);

    thresholds_.speedLow = speedP[0];
    thresholds_.speedHigh = speedP[1];
    thresholds_.distanceLow = distanceP[0];
    thresholds_.distanceHigh = distanceP[1];
    thresholds_.durationLow = durationP[0];
    thresholds_.durationHigh = durationP[1];
    thresholds_.basisCount = speeds.size();
    thresholds_.outliersExcluded = excluded;
}
