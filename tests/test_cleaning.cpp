#include "CleaningPipeline.h"
#include "TripFixtures.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using TripFixtures::TripRow;
using TripFixtures::makeTrip;
using TripFixtures::tripAtMinute;

namespace {
CleaningConfig quietConfig() {
    CleaningConfig cfg;
    cfg.verbose = false;
    return cfg;
}

std::vector<TripRecord> twelveRowScenario() {
    std::vector<TripRecord> rows;
    size_t line = 2;
    rows.push_back(makeTrip(line++, tripAtMinute(1, "400")));
    rows.push_back(makeTrip(line++, tripAtMinute(2, "420")));
    rows.push_back(makeTrip(line++, tripAtMinute(1, "400")));   // duplicate of first
    rows.push_back(makeTrip(line++, tripAtMinute(3, "440")));
    rows.push_back(makeTrip(line++, tripAtMinute(2, "420")));   // duplicate of second

    TripRow badCoord = tripAtMinute(4, "450");
    badCoord.pickupLat = "0.0";
    rows.push_back(makeTrip(line++, badCoord));

    TripRow inverted = tripAtMinute(5, "450");
    inverted.dropoff = "2016-03-14 16:00:00";
    rows.push_back(makeTrip(line++, inverted));

    rows.push_back(makeTrip(line++, tripAtMinute(6, "7200")));  // over max duration

    rows.push_back(makeTrip(line++, tripAtMinute(7, "460")));
    rows.push_back(makeTrip(line++, tripAtMinute(8, "480")));
    rows.push_back(makeTrip(line++, tripAtMinute(9, "500")));
    rows.push_back(makeTrip(line++, tripAtMinute(10, "3000")));
    return rows;
}
}

TEST(CleaningPipeline, TwelveRowEndToEnd) {
    CleaningPipeline cleaner(quietConfig());
    const auto cleaned = cleaner.run(twelveRowScenario());

    ASSERT_EQ(cleaned.size(), 7u);
    const auto& stats = cleaner.statistics();
    EXPECT_EQ(stats.get("total_records"), 12u);
    EXPECT_EQ(stats.get("duplicates_removed"), 2u);
    EXPECT_EQ(stats.get("coordinate_errors"), 1u);
    EXPECT_EQ(stats.get("datetime_errors"), 1u);
    EXPECT_EQ(stats.get("duration_errors"), 1u);
    EXPECT_EQ(stats.get("valid_records"), 7u);
    EXPECT_EQ(stats.get("invalid_records"), 5u);
    EXPECT_EQ(stats.get("outliers_detected"), 1u);

    // Survivors keep input order.
    EXPECT_EQ(cleaned.front().get(TripFields::kId), "id1");
    EXPECT_EQ(cleaned.back().get(TripFields::kId), "id10");
    EXPECT_EQ(cleaned.back().outlier(), OutlierFlag::DURATION_OUTLIER);
    EXPECT_EQ(cleaned.back().get(TripFields::kOutlierFlag), "DURATION_OUTLIER");
    EXPECT_EQ(cleaned.front().get(TripFields::kOutlierFlag), "NORMAL");
    EXPECT_EQ(cleaned.front().get(TripFields::kCalculatedDuration), "3600");

    ASSERT_EQ(cleaner.rejected().size(), 5u);
    EXPECT_EQ(cleaner.rejected()[0].validity(), ValidityFlag::DUPLICATE);
    EXPECT_EQ(cleaner.rejected()[0].rowNumber(), 4u);
    EXPECT_EQ(cleaner.rejected()[2].get(TripFields::kValidityFlag), "INVALID_COORDINATES");
    EXPECT_EQ(cleaner.rejected()[3].validity(), ValidityFlag::INVALID_DATETIME);
    EXPECT_EQ(cleaner.rejected()[4].validity(), ValidityFlag::INVALID_DURATION_OR_PASSENGERS);
    EXPECT_NEAR(cleaner.dataQualityPercent(), 100.0 * 7.0 / 12.0, 1e-9);
}

TEST(CleaningPipeline, StatisticsResetBetweenRuns) {
    CleaningPipeline cleaner(quietConfig());
    cleaner.run(twelveRowScenario());
    cleaner.run(twelveRowScenario(), 3);
    EXPECT_EQ(cleaner.statistics().get("total_records"), 12u);
    EXPECT_EQ(cleaner.statistics().get("duplicates_removed"), 2u);
    EXPECT_EQ(cleaner.statistics().get("malformed_rows"), 3u);
    EXPECT_EQ(cleaner.rejected().size(), 5u);
}

TEST(CleaningPipeline, DedupKeepsFirstOccurrence) {
    CleaningPipeline cleaner(quietConfig());
    TripRow a = tripAtMinute(1, "400");
    TripRow b = a;
    b.id = "other";
    b.dropoffLat = "40.70";  // not part of the key
    const auto kept = cleaner.removeDuplicates({makeTrip(2, a), makeTrip(3, b)});
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].get(TripFields::kId), "id1");
    EXPECT_EQ(cleaner.statistics().get("duplicates_removed"), 1u);
}

TEST(CleaningPipeline, FillsEachMissingFieldAndCountsSubstitutions) {
    CleaningPipeline cleaner(quietConfig());
    TripRow partial = tripAtMinute(1, "400");
    partial.passengers = "";
    partial.vendorId = "  ";
    TripRecord record = makeTrip(2, partial);

    TripRecord noFlag(3);
    noFlag.set(TripFields::kPassengerCount, "2");
    noFlag.set(TripFields::kVendorId, "1");

    std::vector<TripRecord> records = {record, noFlag};
    cleaner.fillMissingValues(records);

    EXPECT_EQ(records[0].get(TripFields::kPassengerCount), "1");
    EXPECT_EQ(records[0].get(TripFields::kVendorId), "1");
    EXPECT_EQ(records[0].get(TripFields::kStoreAndFwdFlag), "N");
    EXPECT_EQ(records[1].get(TripFields::kStoreAndFwdFlag), "N");
    EXPECT_EQ(records[1].get(TripFields::kPassengerCount), "2");

    const auto& stats = cleaner.statistics();
    EXPECT_EQ(stats.get("missing_values_fixed"), 3u);
    EXPECT_EQ(stats.get("passenger_count_defaulted"), 1u);
    EXPECT_EQ(stats.get("vendor_id_defaulted"), 1u);
    EXPECT_EQ(stats.get("store_and_fwd_flag_defaulted"), 1u);
}

TEST(CleaningPipeline, CoordinateBoundsAreInclusiveAndRejectUnparsable) {
    CleaningPipeline cleaner(quietConfig());
    TripRow edge = tripAtMinute(1, "400");
    edge.pickupLat = "40.4774";
    edge.dropoffLon = "-73.7004";
    TripRow garbage = tripAtMinute(2, "400");
    garbage.dropoffLon = "west";
    TripRow outside = tripAtMinute(3, "400");
    outside.dropoffLat = "41.5";
    TripRow doubleSign = tripAtMinute(4, "400");
    doubleSign.pickupLon = "+-73.98";
    TripRow signedPlus = tripAtMinute(5, "400");
    signedPlus.pickupLat = "+40.75";

    const auto kept = cleaner.filterCoordinates({makeTrip(2, edge), makeTrip(3, garbage), makeTrip(4, outside),
                                                 makeTrip(5, doubleSign), makeTrip(6, signedPlus)});
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].get(TripFields::kId), "id1");
    EXPECT_EQ(kept[1].get(TripFields::kId), "id5");
    EXPECT_EQ(cleaner.statistics().get("coordinate_errors"), 3u);
}

TEST(CleaningPipeline, DatetimeRequiresStrictOrderAndLayout) {
    CleaningPipeline cleaner(quietConfig());
    TripRow same = tripAtMinute(1, "400");
    same.dropoff = same.pickup;
    TripRow badLayout = tripAtMinute(2, "400");
    badLayout.pickup = "14/03/2016 17:02:00";
    TripRow good = tripAtMinute(3, "400");
    good.dropoff = "2016-03-14 17:03:01";

    const auto kept = cleaner.filterDatetimes({makeTrip(2, same), makeTrip(3, badLayout), makeTrip(4, good)});
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].get(TripFields::kCalculatedDuration), "1");
    EXPECT_EQ(cleaner.statistics().get("datetime_errors"), 2u);
}

TEST(CleaningPipeline, DurationAndPassengerBounds) {
    CleaningPipeline cleaner(quietConfig());
    std::vector<TripRecord> records;
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"60", "1"}, {"3600", "8"}, {"59", "1"}, {"3601", "1"},
        {"400", "0"}, {"400", "9"}, {"400.5", "1"}, {"400", "two"},
        {"+-400", "1"}, {"400", "+-1"}
    };
    size_t line = 2;
    for (const auto& [duration, passengers] : cases) {
        TripRow s = tripAtMinute(static_cast<int>(line), duration);
        s.passengers = passengers;
        records.push_back(makeTrip(line++, s));
    }
    const auto kept = cleaner.filterDurationAndPassengers(records);
    EXPECT_EQ(kept.size(), 2u);
    EXPECT_EQ(cleaner.statistics().get("duration_errors"), 8u);
}

TEST(CleaningPipeline, LargeDatasetAppliesSampleBoundsToEveryRecord) {
    CleaningConfig cfg = quietConfig();
    cfg.largeDatasetThreshold = 10;
    cfg.outlierSampleSize = 8;
    cfg.samplingSeed = 99;

    std::vector<TripRecord> records;
    for (int i = 0; i < 20; ++i) {
        records.push_back(makeTrip(static_cast<size_t>(i + 2), tripAtMinute(i, std::to_string(100 + i))));
    }
    records.push_back(makeTrip(22, tripAtMinute(30, "3000")));

    CleaningPipeline cleaner(cfg);
    cleaner.annotateOutliers(records);
    EXPECT_TRUE(cleaner.usedSampling());
    EXPECT_EQ(cleaner.sampledCount(), 8u);
    ASSERT_TRUE(cleaner.outlierBounds().has_value());
    EXPECT_EQ(records.back().outlier(), OutlierFlag::DURATION_OUTLIER);
    EXPECT_GE(cleaner.statistics().get("outliers_detected"), 1u);

    const auto firstBounds = *cleaner.outlierBounds();
    CleaningPipeline again(cfg);
    again.annotateOutliers(records);
    EXPECT_DOUBLE_EQ(again.outlierBounds()->lower, firstBounds.lower);
    EXPECT_DOUBLE_EQ(again.outlierBounds()->upper, firstBounds.upper);
}

TEST(CleaningPipeline, SmallDatasetUsesFullSet) {
    CleaningPipeline cleaner(quietConfig());
    std::vector<TripRecord> records;
    for (int i = 0; i < 3; ++i) records.push_back(makeTrip(static_cast<size_t>(i + 2), tripAtMinute(i, "400")));
    cleaner.annotateOutliers(records);
    EXPECT_FALSE(cleaner.usedSampling());
    EXPECT_FALSE(cleaner.outlierBounds().has_value());
    for (const auto& r : records) EXPECT_EQ(r.outlier(), OutlierFlag::NORMAL);
}

TEST(CleaningPipeline, EmptyInputProducesEmptyOutput) {
    CleaningPipeline cleaner(quietConfig());
    EXPECT_TRUE(cleaner.run({}).empty());
    EXPECT_DOUBLE_EQ(cleaner.dataQualityPercent(), 0.0);
}
