#include "Algorithms.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace Algorithms;

TEST(SortByKey, SortsAscendingAndDescending) {
    const std::vector<double> values = {5, 3, 9, 1, 7, 3};
    EXPECT_EQ(sortValues(values), (std::vector<double>{1, 3, 3, 5, 7, 9}));
    EXPECT_EQ(sortValues(values, true), (std::vector<double>{9, 7, 5, 3, 3, 1}));
}

TEST(SortByKey, EmptyAndSingleReturnedUnchanged) {
    EXPECT_TRUE(sortValues({}).empty());
    EXPECT_EQ(sortValues({42.0}), (std::vector<double>{42.0}));
}

TEST(SortByKey, EqualKeysKeepInputOrder) {
    using Item = std::pair<int, std::string>;
    const std::vector<Item> items = {{2, "a"}, {1, "b"}, {2, "c"}, {1, "d"}, {2, "e"}};
    const auto sorted = sortByKey(items, [](const Item& i) { return i.first; });
    const std::vector<std::string> order = {sorted[0].second, sorted[1].second, sorted[2].second,
                                            sorted[3].second, sorted[4].second};
    EXPECT_EQ(order, (std::vector<std::string>{"b", "d", "a", "c", "e"}));

    const auto reversed = sortByKey(items, [](const Item& i) { return i.first; }, true);
    EXPECT_EQ(reversed[0].second, "a");
    EXPECT_EQ(reversed[1].second, "c");
    EXPECT_EQ(reversed[2].second, "e");
    EXPECT_EQ(reversed[3].second, "b");
}

TEST(SortByKey, TiedKeysAheadOfSmallerKeyStayInOrder) {
    using Item = std::pair<int, std::string>;
    const auto sorted = sortByKey(std::vector<Item>{{5, "a"}, {5, "b"}, {3, "c"}},
                                  [](const Item& i) { return i.first; });
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0], (Item{3, "c"}));
    EXPECT_EQ(sorted[1], (Item{5, "a"}));
    EXPECT_EQ(sorted[2], (Item{5, "b"}));
}

TEST(SortByKey, NaNKeysTerminate) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const auto sorted = sortValues({3.0, nan, 1.0, nan, 2.0});
    EXPECT_EQ(sorted.size(), 5u);
}

TEST(SortByKey, LargeAlreadySortedInputDoesNotRecurse) {
    std::vector<double> values(20000);
    for (size_t i = 0; i < values.size(); ++i) values[i] = static_cast<double>(i);
    const auto sorted = sortValues(values, true);
    EXPECT_EQ(sorted.front(), 19999.0);
    EXPECT_EQ(sorted.back(), 0.0);
}

TEST(SortByKey, CountsComparisons) {
    OperationCounters ops;
    sortValues({4, 2, 8, 6}, false, &ops);
    EXPECT_GT(ops.comparisons, 0u);
    ops.reset();
    EXPECT_EQ(ops.comparisons, 0u);
}

TEST(Percentile, EndpointsAndInterpolation) {
    const std::vector<double> values = {4, 1, 3, 2};
    EXPECT_DOUBLE_EQ(percentile(values, 0), 1.0);
    EXPECT_DOUBLE_EQ(percentile(values, 100), 4.0);
    EXPECT_DOUBLE_EQ(percentile(values, 50), 2.5);
    EXPECT_DOUBLE_EQ(percentile(values, 25), 1.75);
}

TEST(Percentile, OneToTen) {
    std::vector<double> values;
    for (int i = 10; i >= 1; --i) values.push_back(i);
    EXPECT_DOUBLE_EQ(percentile(values, 50), 5.5);
    EXPECT_DOUBLE_EQ(percentile(values, 25), 3.25);
}

TEST(Percentile, EmptyReturnsZeroAndOutOfRangeClamps) {
    EXPECT_DOUBLE_EQ(percentile({}, 50), 0.0);
    EXPECT_DOUBLE_EQ(percentile({1, 2, 3}, -10), 1.0);
    EXPECT_DOUBLE_EQ(percentile({1, 2, 3}, 250), 3.0);
}

TEST(Percentile, MultiVariantMatchesSingle) {
    const std::vector<double> values = {10, 20, 30, 40, 50, 60};
    const auto ps = percentiles(values, {10, 90});
    ASSERT_EQ(ps.size(), 2u);
    EXPECT_DOUBLE_EQ(ps[0], percentile(values, 10));
    EXPECT_DOUBLE_EQ(ps[1], percentile(values, 90));
}

TEST(DetectOutliersIQR, FewerThanFourValuesHasNoBounds) {
    const auto result = detectOutliersIQR({1, 2, 100}, 1.5);
    EXPECT_TRUE(result.outlierIndices.empty());
    EXPECT_FALSE(result.bounds.has_value());
}

TEST(DetectOutliersIQR, FlagsValuesStrictlyOutsideFences) {
    const auto result = detectOutliersIQR({1, 2, 3, 4, 100}, 1.5);
    ASSERT_TRUE(result.bounds.has_value());
    EXPECT_DOUBLE_EQ(result.bounds->q1, 2.0);
    EXPECT_DOUBLE_EQ(result.bounds->q3, 4.0);
    EXPECT_DOUBLE_EQ(result.bounds->iqr, 2.0);
    EXPECT_DOUBLE_EQ(result.bounds->lower, -1.0);
    EXPECT_DOUBLE_EQ(result.bounds->upper, 7.0);
    EXPECT_EQ(result.outlierIndices, (std::vector<size_t>{4}));
}

TEST(DetectOutliersIQR, UnflaggedValuesLieWithinBounds) {
    std::mt19937 rng(99);
    std::uniform_real_distribution<double> body(300.0, 900.0);
    std::vector<double> values;
    for (int i = 0; i < 200; ++i) values.push_back(body(rng));
    values.push_back(5.0);
    values.push_back(3500.0);
    values.push_back(3400.0);

    const auto result = detectOutliersIQR(values, 2.0);
    ASSERT_TRUE(result.bounds.has_value());
    const std::set<size_t> flagged(result.outlierIndices.begin(), result.outlierIndices.end());
    EXPECT_TRUE(flagged.count(values.size() - 1));
    EXPECT_TRUE(flagged.count(values.size() - 2));
    for (size_t i = 0; i < values.size(); ++i) {
        const bool inside = values[i] >= result.bounds->lower && values[i] <= result.bounds->upper;
        EXPECT_EQ(inside, flagged.count(i) == 0) << "index " << i << " value " << values[i];
    }
}

TEST(DetectOutliersIQR, BoundsApplyToAnotherPopulation) {
    IqrBounds bounds;
    bounds.lower = 0.0;
    bounds.upper = 10.0;
    EXPECT_EQ(indicesOutside({-1, 0, 5, 10, 11}, bounds), (std::vector<size_t>{0, 4}));
}

TEST(TopK, ReturnsLargestDescending) {
    const std::vector<int> items = {5, 1, 9, 3, 7};
    const auto identity = [](int v) { return v; };
    EXPECT_EQ(topK(items, 2, identity), (std::vector<int>{9, 7}));
    EXPECT_TRUE(topK(items, 0, identity).empty());
    EXPECT_EQ(topK(items, 10, identity), (std::vector<int>{9, 7, 5, 3, 1}));
}

TEST(TopK, LargestMultisetForEveryK) {
    const std::vector<int> items = {5, 5, 5, 1, 5, 2};
    const auto identity = [](int v) { return v; };
    EXPECT_EQ(topK(items, 3, identity), (std::vector<int>{5, 5, 5}));

    std::vector<int> descending = items;
    std::sort(descending.begin(), descending.end(), std::greater<int>());
    for (size_t k = 0; k <= items.size(); ++k) {
        std::vector<int> best = topK(items, k, identity);
        std::sort(best.begin(), best.end(), std::greater<int>());
        const std::vector<int> expected(descending.begin(), descending.begin() + static_cast<long>(k));
        EXPECT_EQ(best, expected) << "k=" << k;
    }
}

TEST(TopK, HeapPathCountsWork) {
    std::vector<int> items;
    for (int i = 0; i < 100; ++i) items.push_back((i * 37) % 101);
    OperationCounters ops;
    const auto best = topK(items, 3, [](int v) { return v; }, &ops);
    EXPECT_EQ(best, (std::vector<int>{100, 99, 98}));
    EXPECT_GT(ops.comparisons, 0u);
    EXPECT_GT(ops.swaps, 0u);
}

TEST(GroupBy, KeepsFirstSeenKeyOrderAndItemOrder) {
    const std::vector<std::string> items = {"b1", "a1", "b2", "c1", "a2"};
    const auto groups = groupBy(items, [](const std::string& s) { return s.substr(0, 1); });
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].first, "b");
    EXPECT_EQ(groups[0].second, (std::vector<std::string>{"b1", "b2"}));
    EXPECT_EQ(groups[1].first, "a");
    EXPECT_EQ(groups[1].second, (std::vector<std::string>{"a1", "a2"}));
    EXPECT_EQ(groups[2].first, "c");
}

TEST(Describe, PopulationStatistics) {
    const auto stats = describe({2, 4, 4, 4, 5, 5, 7, 9});
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->count, 8u);
    EXPECT_DOUBLE_EQ(stats->mean, 5.0);
    EXPECT_NEAR(stats->variance, 4.0, 1e-12);
    EXPECT_NEAR(stats->stdDev, 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(stats->min, 2.0);
    EXPECT_DOUBLE_EQ(stats->max, 9.0);
    EXPECT_DOUBLE_EQ(stats->range, 7.0);
    EXPECT_FALSE(describe({}).has_value());
}

TEST(Haversine, ZeroSymmetricAndKnownArc) {
    EXPECT_DOUBLE_EQ(haversineKm(40.75, -73.98, 40.75, -73.98), 0.0);
    const double ab = haversineKm(40.7831, -73.9712, 40.6782, -73.9442);
    const double ba = haversineKm(40.6782, -73.9442, 40.7831, -73.9712);
    EXPECT_NEAR(ab, ba, 1e-9);
    EXPECT_GT(ab, 0.0);
    EXPECT_NEAR(haversineKm(0.0, 0.0, 1.0, 0.0), kEarthRadiusKm * std::acos(-1.0) / 180.0, 1e-9);
}

TEST(SampleWithoutReplacement, ReproducibleAndDistinct) {
    std::vector<double> values(100);
    for (size_t i = 0; i < values.size(); ++i) values[i] = static_cast<double>(i);

    std::mt19937 a(1337);
    std::mt19937 b(1337);
    const auto first = sampleWithoutReplacement(values, 20, a);
    const auto second = sampleWithoutReplacement(values, 20, b);
    EXPECT_EQ(first, second);
    EXPECT_EQ(std::set<double>(first.begin(), first.end()).size(), 20u);

    std::mt19937 c(7);
    EXPECT_EQ(sampleWithoutReplacement(values, 500, c).size(), values.size());
}
