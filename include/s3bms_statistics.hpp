/*
 * ============================================================================
 * S3 BMS ACQUISITION - STATISTICS AGGREGATOR
 * ============================================================================
 *
 * Reduces an ordered sample sequence (or an index sub-range of it) to
 * {avg, min, max, delta} in a single pass with O(1) extra memory.
 *
 *   - integral samples (cell voltage, mV): avg is the truncated mean
 *   - floating samples (temperature, °C):  avg is the true mean
 *   - delta = max - min
 *
 * An empty sequence or empty range is a precondition violation and throws
 * EmptySeries.
 *
 * LICENSE: MIT
 *
 * ============================================================================
 */

#ifndef S3BMS_STATISTICS_HPP
#define S3BMS_STATISTICS_HPP

#include "s3bms_errors.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace s3bms {

template <typename T>
struct SeriesStats {
    T avg{};
    T min{};
    T max{};
    T delta{};
};

using VoltageStats = SeriesStats<std::uint16_t>;  // mV
using TempStats = SeriesStats<double>;            // °C

// Half-open index range [begin, end)
struct IndexRange {
    std::size_t begin = 0;
    std::size_t end = 0;

    std::size_t size() const { return end > begin ? end - begin : 0; }
    bool empty() const { return end <= begin; }
};

// ============================================================================
// RUNNING ACCUMULATOR
// ============================================================================

template <typename T>
class StatsAccumulator {
    static_assert(std::is_arithmetic<T>::value, "samples must be numeric");

    // Wide enough that summing a full pack cannot overflow
    using Sum = typename std::conditional<
        std::is_floating_point<T>::value, double,
        typename std::conditional<std::is_signed<T>::value,
                                  long long, unsigned long long>::type>::type;

    T min_{};
    T max_{};
    Sum sum_{};
    std::size_t count_ = 0;

public:
    void add(T sample) {
        if (count_ == 0 || sample < min_) min_ = sample;
        if (count_ == 0 || sample > max_) max_ = sample;
        sum_ += static_cast<Sum>(sample);
        ++count_;
    }

    std::size_t count() const { return count_; }

    // Integer division truncates for integral T
    T average() const {
        if (count_ == 0) throw EmptySeries("average of an empty series");
        return static_cast<T>(sum_ / static_cast<Sum>(count_));
    }

    SeriesStats<T> result() const {
        if (count_ == 0) throw EmptySeries("statistics of an empty series");

        SeriesStats<T> stats;
        stats.avg = average();
        stats.min = min_;
        stats.max = max_;
        stats.delta = static_cast<T>(max_ - min_);
        return stats;
    }
};

// ============================================================================
// AGGREGATION
// ============================================================================

inline void check_range(std::size_t length, IndexRange range) {
    if (range.begin > range.end || range.end > length) {
        throw std::out_of_range(
            "index range [" + std::to_string(range.begin) + ", " +
            std::to_string(range.end) + ") exceeds series of length " +
            std::to_string(length));
    }
}

template <typename T>
SeriesStats<T> compute_stats(const std::vector<T>& samples, IndexRange range) {
    check_range(samples.size(), range);
    if (range.empty()) {
        throw EmptySeries("range [" + std::to_string(range.begin) + ", " +
                          std::to_string(range.end) + ") contains no samples");
    }

    StatsAccumulator<T> acc;
    for (std::size_t i = range.begin; i < range.end; ++i) {
        acc.add(samples[i]);
    }
    return acc.result();
}

template <typename T>
SeriesStats<T> compute_stats(const std::vector<T>& samples) {
    return compute_stats(samples, IndexRange{0, samples.size()});
}

template <typename T>
T series_average(const std::vector<T>& samples) {
    StatsAccumulator<T> acc;
    for (T s : samples) acc.add(s);
    return acc.average();
}

// Union of two disjoint partitions. The average of the union is not
// derivable from the parts, so the caller supplies it.
template <typename T>
SeriesStats<T> merge_bounds(const SeriesStats<T>& a, const SeriesStats<T>& b, T avg) {
    SeriesStats<T> merged;
    merged.avg = avg;
    merged.min = a.min < b.min ? a.min : b.min;
    merged.max = a.max > b.max ? a.max : b.max;
    merged.delta = static_cast<T>(merged.max - merged.min);
    return merged;
}

} // namespace s3bms

#endif // S3BMS_STATISTICS_HPP
