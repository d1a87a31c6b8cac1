#include "Algorithms.h"

#include <algorithm>
#include <cmath>

namespace Algorithms {
namespace {
constexpr double kPi = 3.14159265358979323846;

double toRadians(double degrees) {
    return degrees * kPi / 180.0;
}
}

double percentileSorted(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    const double pp = std::clamp(p, 0.0, 100.0);
    if (pp <= 0.0) return sorted.front();
    if (pp >= 100.0) return sorted.back();

    const double pos = (pp / 100.0) * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    const double t = pos - static_cast<double>(lo);
    return sorted[lo] * (1.0 - t) + sorted[hi] * t;
}

double percentile(const std::vector<double>& values, double p, OperationCounters* counters) {
    if (values.empty()) return 0.0;
    return percentileSorted(sortValues(values, false, counters), p);
}

std::vector<double> percentiles(const std::vector<double>& values,
                                const std::vector<double>& ps,
                                OperationCounters* counters) {
    std::vector<double> out(ps.size(), 0.0);
    if (values.empty()) return out;

    const std::vector<double> sorted = sortValues(values, false, counters);
    for (size_t i = 0; i < ps.size(); ++i) {
        out[i] = percentileSorted(sorted, ps[i]);
    }
    return out;
}

IqrOutlierResult detectOutliersIQR(const std::vector<double>& values,
                                   double multiplier,
                                   OperationCounters* counters) {
    IqrOutlierResult result;
    if (values.size() < 4) return result;

    const std::vector<double> quartiles = percentiles(values, {25.0, 75.0}, counters);
    IqrBounds bounds;
    bounds.q1 = quartiles[0];
    bounds.q3 = quartiles[1];
    bounds.iqr = bounds.q3 - bounds.q1;
    bounds.lower = bounds.q1 - multiplier * bounds.iqr;
    bounds.upper = bounds.q3 + multiplier * bounds.iqr;

    result.outlierIndices = indicesOutside(values, bounds);
    result.bounds = bounds;
    return result;
}

std::vector<size_t> indicesOutside(const std::vector<double>& values, const IqrBounds& bounds) {
    std::vector<size_t> out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (bounds.isOutside(values[i])) out.push_back(i);
    }
    return out;
}

std::optional<DescriptiveStats> describe(const std::vector<double>& values) {
    if (values.empty()) return std::nullopt;

    // Welford's running update keeps this a single pass.
    DescriptiveStats stats;
    double m2 = 0.0;
    stats.min = values.front();
    stats.max = values.front();
    for (double v : values) {
        ++stats.count;
        const double delta = v - stats.mean;
        stats.mean += delta / static_cast<double>(stats.count);
        m2 += delta * (v - stats.mean);
        if (v < stats.min) stats.min = v;
        if (v > stats.max) stats.max = v;
    }
    stats.variance = m2 / static_cast<double>(stats.count);
    stats.stdDev = std::sqrt(stats.variance);
    stats.range = stats.max - stats.min;
    return stats;
}

double haversineKm(double lat1, double lon1, double lat2, double lon2) {
    const double phi1 = toRadians(lat1);
    const double phi2 = toRadians(lat2);
    const double dPhi = toRadians(lat2 - lat1);
    const double dLambda = toRadians(lon2 - lon1);

    const double sinPhi = std::sin(dPhi / 2.0);
    const double sinLambda = std::sin(dLambda / 2.0);
    double a = sinPhi * sinPhi + std::cos(phi1) * std::cos(phi2) * sinLambda * sinLambda;
    a = std::clamp(a, 0.0, 1.0);
    return 2.0 * kEarthRadiusKm * std::asin(std::sqrt(a));
}

std::vector<double> sampleWithoutReplacement(const std::vector<double>& values, size_t k, std::mt19937& rng) {
    std::vector<double> pool = values;
    const size_t take = std::min(k, pool.size());
    for (size_t i = 0; i < take; ++i) {
        std::uniform_int_distribution<size_t> pick(i, pool.size() - 1);
        std::swap(pool[i], pool[pick(rng)]);
    }
    pool.resize(take);
    return pool;
}

} // namespace Algorithms
