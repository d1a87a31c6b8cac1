#pragma once

#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Algorithms {

constexpr double kEarthRadiusKm = 6371.0;

/**
 * Comparison / swap tallies for sort and heap work.
 * Owned by the caller (one per pipeline run); never shared between runs.
 */
struct OperationCounters {
    size_t comparisons = 0;
    size_t swaps = 0;

    void reset() noexcept {
        comparisons = 0;
        swaps = 0;
    }
};

struct IqrBounds {
    double q1 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
    double lower = 0.0;
    double upper = 0.0;

    bool isOutside(double value) const noexcept { return value < lower || value > upper; }
};

struct IqrOutlierResult {
    std::vector<size_t> outlierIndices;
    std::optional<IqrBounds> bounds;
};

struct DescriptiveStats {
    size_t count = 0;
    double mean = 0.0;
    double variance = 0.0;
    double stdDev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double range = 0.0;
};

template <typename T>
using GroupedItems = std::vector<std::pair<std::string, std::vector<T>>>;

/**
 * @brief Partition-based stable sort keyed by `key(item)`.
 * @details Pivot is the middle element of each segment. Items are bucketed into
 *          less / equal / greater (swapped when reverse) keeping input order, so
 *          equal keys retain their relative order. Segments are processed from an
 *          explicit work stack; worst case is O(n^2) on adversarial input.
 * @post Returns a permutation of `items`.
 */
template <typename T, typename KeyFn>
std::vector<T> sortByKey(std::vector<T> items, KeyFn key, bool reverse = false, OperationCounters* counters = nullptr) {
    if (items.size() <= 1) return items;

    std::vector<std::pair<size_t, size_t>> work;
    work.emplace_back(0, items.size());

    std::vector<T> less;
    std::vector<T> equal;
    std::vector<T> greater;

    while (!work.empty()) {
        const auto [begin, end] = work.back();
        work.pop_back();
        if (end - begin <= 1) continue;

        const auto pivotKey = key(items[begin + (end - begin) / 2]);
        less.clear();
        equal.clear();
        greater.clear();

        for (size_t i = begin; i < end; ++i) {
            if (counters) ++counters->comparisons;
            const auto itemKey = key(items[i]);
            const bool before = reverse ? (itemKey > pivotKey) : (itemKey < pivotKey);
            const bool after = reverse ? (itemKey < pivotKey) : (itemKey > pivotKey);
            if (before) {
                less.push_back(std::move(items[i]));
            } else if (after) {
                greater.push_back(std::move(items[i]));
            } else {
                equal.push_back(std::move(items[i]));
            }
        }

        size_t cursor = begin;
        for (auto& item : less) items[cursor++] = std::move(item);
        for (auto& item : equal) items[cursor++] = std::move(item);
        for (auto& item : greater) items[cursor++] = std::move(item);

        const size_t lessEnd = begin + less.size();
        const size_t greaterBegin = lessEnd + equal.size();
        if (end - greaterBegin > 1) work.emplace_back(greaterBegin, end);
        if (lessEnd - begin > 1) work.emplace_back(begin, lessEnd);
    }
    return items;
}

inline std::vector<double> sortValues(std::vector<double> values, bool reverse = false, OperationCounters* counters = nullptr) {
    return sortByKey(std::move(values), [](double v) { return v; }, reverse, counters);
}

namespace detail {

template <typename T, typename KeyFn>
void siftUp(std::vector<T>& heap, size_t index, KeyFn& key, OperationCounters* counters) {
    while (index > 0) {
        const size_t parent = (index - 1) / 2;
        if (counters) ++counters->comparisons;
        if (!(key(heap[index]) < key(heap[parent]))) break;
        std::swap(heap[index], heap[parent]);
        if (counters) ++counters->swaps;
        index = parent;
    }
}

template <typename T, typename KeyFn>
void siftDown(std::vector<T>& heap, size_t index, KeyFn& key, OperationCounters* counters) {
    const size_t n = heap.size();
    while (true) {
        const size_t left = 2 * index + 1;
        const size_t right = left + 1;
        size_t smallest = index;
        if (left < n) {
            if (counters) ++counters->comparisons;
            if (key(heap[left]) < key(heap[smallest])) smallest = left;
        }
        if (right < n) {
            if (counters) ++counters->comparisons;
            if (key(heap[right]) < key(heap[smallest])) smallest = right;
        }
        if (smallest == index) return;
        std::swap(heap[index], heap[smallest]);
        if (counters) ++counters->swaps;
        index = smallest;
    }
}

} // namespace detail

/**
 * @brief Returns the k largest items by key, sorted descending.
 * @details Bounded min-heap of size k; an incoming item replaces the heap
 *          minimum only when its key is strictly greater.
 */
template <typename T, typename KeyFn>
std::vector<T> topK(const std::vector<T>& items, size_t k, KeyFn key, OperationCounters* counters = nullptr) {
    if (k == 0) return {};
    if (k >= items.size()) return sortByKey(items, key, true, counters);

    std::vector<T> heap;
    heap.reserve(k);
    for (const auto& item : items) {
        if (heap.size() < k) {
            heap.push_back(item);
            detail::siftUp(heap, heap.size() - 1, key, counters);
            continue;
        }
        if (counters) ++counters->comparisons;
        if (key(item) > key(heap.front())) {
            heap.front() = item;
            detail::siftDown(heap, 0, key, counters);
        }
    }
    return sortByKey(std::move(heap), key, true, counters);
}

/**
 * @brief Groups items by a string key in first-seen order.
 * @post Within each group items keep their input order.
 */
template <typename T, typename KeyFn>
GroupedItems<T> groupBy(const std::vector<T>& items, KeyFn key) {
    GroupedItems<T> groups;
    std::unordered_map<std::string, size_t> slot;
    for (const auto& item : items) {
        std::string k = key(item);
        auto it = slot.find(k);
        if (it == slot.end()) {
            it = slot.emplace(k, groups.size()).first;
            groups.emplace_back(std::move(k), std::vector<T>{});
        }
        groups[it->second].second.push_back(item);
    }
    return groups;
}

/**
 * @brief Linear-interpolated percentile for p in [0,100] (clamped).
 * @post Returns 0.0 for empty input; callers must check size when 0 is meaningful.
 */
double percentile(const std::vector<double>& values, double p, OperationCounters* counters = nullptr);

/**
 * @brief Several percentiles from a single sort; result[i] matches ps[i].
 */
std::vector<double> percentiles(const std::vector<double>& values,
                                const std::vector<double>& ps,
                                OperationCounters* counters = nullptr);

double percentileSorted(const std::vector<double>& sorted, double p);

/**
 * @brief Tukey fence outlier detection.
 * @post Fewer than 4 values -> empty indices and no bounds.
 */
IqrOutlierResult detectOutliersIQR(const std::vector<double>& values,
                                   double multiplier,
                                   OperationCounters* counters = nullptr);

std::vector<size_t> indicesOutside(const std::vector<double>& values, const IqrBounds& bounds);

std::optional<DescriptiveStats> describe(const std::vector<double>& values);

double haversineKm(double lat1, double lon1, double lat2, double lon2);

/**
 * @brief Uniform sample of min(k, n) values without replacement.
 * @details Partial Fisher-Yates over a copy; identical seeds give identical samples.
 */
std::vector<double> sampleWithoutReplacement(const std::vector<double>& values, size_t k, std::mt19937& rng);

} // namespace Algorithms
