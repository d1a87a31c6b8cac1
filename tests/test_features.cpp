#include "CommonUtils.h"
#include "FeatureEngineer.h"
#include "TripFixtures.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using TripFixtures::TripRow;
using TripFixtures::makeTrip;

namespace {
FeatureConfig quietConfig() {
    FeatureConfig cfg;
    cfg.verbose = false;
    return cfg;
}

TripRow manhattanToBrooklyn() {
    TripRow s;
    s.pickupLat = "40.7831";
    s.pickupLon = "-73.9712";
    s.dropoffLat = "40.6782";
    s.dropoffLon = "-73.9442";
    s.duration = "1800";
    return s;
}
}

TEST(FeatureEngineer, ZeroDisplacementTrip) {
    TripRow s;
    s.dropoffLat = s.pickupLat;
    s.dropoffLon = s.pickupLon;
    s.duration = "120";
    std::vector<TripRecord> records = {makeTrip(2, s)};

    FeatureEngineer engineer(quietConfig());
    const auto features = engineer.run(records);
    ASSERT_EQ(features.size(), 1u);

    const TripFeatures& f = features[0];
    EXPECT_DOUBLE_EQ(f.tripDistanceKm, 0.0);
    EXPECT_DOUBLE_EQ(f.tripSpeedKmh, 0.0);
    EXPECT_DOUBLE_EQ(f.efficiencyScore, 0.0);
    EXPECT_DOUBLE_EQ(f.distancePerMinute, 0.0);
    EXPECT_DOUBLE_EQ(f.estimatedIdleTime, 120.0);
    EXPECT_DOUBLE_EQ(f.tripComplexity, 1.0);

    EXPECT_EQ(records[0].get("trip_distance_km"), "0.000");
    EXPECT_EQ(records[0].get("trip_speed_kmh"), "0.00");
    EXPECT_EQ(records[0].get("efficiency_score"), "0.0");
    EXPECT_EQ(records[0].get("estimated_idle_time"), "120");
    EXPECT_EQ(records[0].get("trip_complexity"), "1.00");
    EXPECT_EQ(records[0].get("trip_type"), "Intra-borough");
}

TEST(FeatureEngineer, DistanceSpeedAndEfficiencyChainOnStoredValues) {
    std::vector<TripRecord> records = {makeTrip(2, manhattanToBrooklyn())};
    FeatureEngineer engineer(quietConfig());
    const TripFeatures f = engineer.run(records).front();

    const double expectedKm = CommonUtils::roundTo(Algorithms::haversineKm(40.7831, -73.9712, 40.6782, -73.9442), 3);
    EXPECT_DOUBLE_EQ(f.tripDistanceKm, expectedKm);
    EXPECT_DOUBLE_EQ(f.tripSpeedKmh, CommonUtils::roundTo(expectedKm * 2.0, 2));
    EXPECT_DOUBLE_EQ(f.distancePerMinute, CommonUtils::roundTo(expectedKm / 30.0, 4));
    EXPECT_DOUBLE_EQ(f.efficiencyScore, CommonUtils::roundTo(std::min(100.0, f.tripSpeedKmh / 40.0 * 100.0), 1));
    EXPECT_DOUBLE_EQ(f.tripComplexity, CommonUtils::roundTo(1800.0 / (expectedKm / 20.0 * 3600.0), 2));
    EXPECT_EQ(records[0].get("trip_distance_km"), CommonUtils::toFixed(expectedKm, 3));

    EXPECT_EQ(f.pickupBorough, "Manhattan");
    EXPECT_EQ(f.dropoffBorough, "Brooklyn");
    EXPECT_EQ(f.tripType, "Inter-borough");
}

TEST(FeatureEngineer, TemporalFeaturesForWeekdayRushHour) {
    std::vector<TripRecord> records = {makeTrip(2, TripRow{})};
    FeatureEngineer engineer(quietConfig());
    const TripFeatures f = engineer.run(records).front();

    EXPECT_EQ(f.pickupHour, 17);
    EXPECT_EQ(f.timeOfDay, "Evening");
    EXPECT_EQ(f.dayOfWeek, "Monday");
    EXPECT_FALSE(f.isWeekend);
    EXPECT_EQ(f.pickupMonth, 3);
    EXPECT_TRUE(f.isRushHour);
    EXPECT_EQ(records[0].get("is_rush_hour"), "True");
    EXPECT_EQ(records[0].get("is_weekend"), "False");
    EXPECT_EQ(engineer.statistics().get("time_features"), 6u);
}

TEST(FeatureEngineer, WeekendMorningIsNotRushHour) {
    TripRow s;
    s.pickup = "2016-03-19 08:00:00";
    std::vector<TripRecord> records = {makeTrip(2, s)};
    FeatureEngineer engineer(quietConfig());
    const TripFeatures f = engineer.run(records).front();

    EXPECT_EQ(f.dayOfWeek, "Saturday");
    EXPECT_TRUE(f.isWeekend);
    EXPECT_EQ(f.timeOfDay, "Morning");
    EXPECT_FALSE(f.isRushHour);
}

TEST(FeatureEngineer, UnparsableFieldsFallBackToDefaults) {
    TripRow s;
    s.pickup = "not a date";
    s.pickupLat = "";
    std::vector<TripRecord> records = {makeTrip(2, s)};
    FeatureEngineer engineer(quietConfig());
    const TripFeatures f = engineer.run(records).front();

    EXPECT_EQ(f.pickupHour, 0);
    EXPECT_EQ(f.timeOfDay, "Unknown");
    EXPECT_EQ(f.dayOfWeek, "Unknown");
    EXPECT_FALSE(f.isWeekend);
    EXPECT_EQ(f.pickupMonth, 1);
    EXPECT_FALSE(f.isRushHour);
    EXPECT_DOUBLE_EQ(f.tripDistanceKm, 0.0);
    EXPECT_EQ(f.pickupBorough, "Unknown");
    EXPECT_EQ(f.tripType, "Unknown");

    const auto& stats = engineer.statistics();
    EXPECT_EQ(stats.get("time_fallbacks"), 1u);
    EXPECT_EQ(stats.get("distance_fallbacks"), 1u);
    EXPECT_EQ(stats.get("zone_fallbacks"), 1u);
    EXPECT_EQ(stats.get("records_processed"), 1u);
}

TEST(FeatureEngineer, AppendsDerivedColumnsInFixedOrder) {
    TripRecord record = makeTrip(2, manhattanToBrooklyn());
    const size_t inputFields = record.fields().size();
    std::vector<TripRecord> records = {record, makeTrip(3, TripRow{})};

    FeatureEngineer engineer(quietConfig());
    const auto features = engineer.run(records);
    EXPECT_EQ(features.size(), records.size());

    const auto& derived = FeatureEngineer::derivedColumns();
    for (const auto& r : records) {
        ASSERT_EQ(r.fields().size(), inputFields + derived.size());
        for (size_t i = 0; i < derived.size(); ++i) {
            EXPECT_EQ(r.fields()[inputFields + i].first, derived[i]);
        }
    }
}

TEST(FeatureEngineer, TimeOfDayBoundaries) {
    EXPECT_STREQ(FeatureEngineer::timeOfDayLabel(4), "Night");
    EXPECT_STREQ(FeatureEngineer::timeOfDayLabel(5), "Morning");
    EXPECT_STREQ(FeatureEngineer::timeOfDayLabel(11), "Morning");
    EXPECT_STREQ(FeatureEngineer::timeOfDayLabel(12), "Afternoon");
    EXPECT_STREQ(FeatureEngineer::timeOfDayLabel(16), "Afternoon");
    EXPECT_STREQ(FeatureEngineer::timeOfDayLabel(17), "Evening");
    EXPECT_STREQ(FeatureEngineer::timeOfDayLabel(20), "Evening");
    EXPECT_STREQ(FeatureEngineer::timeOfDayLabel(21), "Night");
    EXPECT_STREQ(FeatureEngineer::timeOfDayLabel(0), "Night");
}

TEST(FeatureEngineer, NearestBoroughMatchesCenters) {
    for (const auto& center : FeatureEngineer::boroughCenters()) {
        EXPECT_EQ(FeatureEngineer::nearestBorough(center.lat, center.lon), center.name);
    }
}

TEST(FeatureEngineer, PatternTags) {
    const FeatureConfig cfg = quietConfig();
    PatternThresholds t;
    t.speedLow = 10.0;
    t.speedHigh = 30.0;
    t.distanceLow = 1.0;
    t.distanceHigh = 10.0;
    t.durationLow = 300.0;
    t.durationHigh = 1500.0;

    EXPECT_EQ(FeatureEngineer::classifyPatterns(20.0, 5.0, 900.0, t, cfg), "Normal");
    EXPECT_EQ(FeatureEngineer::classifyPatterns(4.0, 0.4, 2000.0, t, cfg), "Slow;Short;Extended;Traffic;Local;Journey");
    EXPECT_EQ(FeatureEngineer::classifyPatterns(40.0, 12.0, 200.0, t, cfg), "Fast;Long;Quick");
}

TEST(FeatureEngineer, PatternThresholdsCanExcludeOutliers) {
    std::vector<TripRecord> base;
    for (int i = 0; i < 9; ++i) {
        TripRow s = manhattanToBrooklyn();
        s.duration = std::to_string(600 + 60 * i);
        base.push_back(makeTrip(static_cast<size_t>(i + 2), s));
    }
    TripRow slow = manhattanToBrooklyn();
    slow.duration = "3500";
    base.push_back(makeTrip(11, slow));
    base.back().setOutlier(OutlierFlag::DURATION_OUTLIER);

    std::vector<TripRecord> included = base;
    FeatureEngineer withOutliers(quietConfig());
    withOutliers.run(included);
    EXPECT_EQ(withOutliers.thresholds().basisCount, 10u);
    EXPECT_FALSE(withOutliers.thresholds().outliersExcluded);

    FeatureConfig cfg = quietConfig();
    cfg.patternThresholdsExcludeOutliers = true;
    std::vector<TripRecord> excluded = base;
    FeatureEngineer withoutOutliers(cfg);
    withoutOutliers.run(excluded);
    EXPECT_EQ(withoutOutliers.thresholds().basisCount, 9u);
    EXPECT_TRUE(withoutOutliers.thresholds().outliersExcluded);
    EXPECT_LT(withoutOutliers.thresholds().durationHigh, withOutliers.thresholds().durationHigh);

    // Tags are still assigned to the outlier record.
    EXPECT_NE(excluded.back().get("trip_patterns").find("Extended"), std::string::npos);
}
