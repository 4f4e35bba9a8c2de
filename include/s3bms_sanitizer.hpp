/*
 * ============================================================================
 * S3 BMS ACQUISITION - OUTLIER SANITIZER
 * ============================================================================
 *
 * The controller's sensor bus occasionally reports saturated or zeroed
 * values on a dead cell tap. Naive min/max over such data shows
 * implausible spreads. The sanitizer is a display-safety filter, not a
 * measurement correction, and the operator can switch it off.
 *
 * Two independent fences:
 *   - SanitizeFence [lo, hi] (inclusive): samples strictly outside are
 *     replaced by the average of the raw series.
 *   - ReportFence (strict profiles only): after replacement, the reported
 *     min only considers samples above min_above and the reported max only
 *     samples below max_below, so a replaced value cannot itself become
 *     the displayed bound.
 *
 * LICENSE: MIT
 *
 * ============================================================================
 */

#ifndef S3BMS_SANITIZER_HPP
#define S3BMS_SANITIZER_HPP

#include "s3bms_statistics.hpp"

#include <vector>

namespace s3bms {

template <typename T>
struct SanitizeFence {
    T lo{};
    T hi{};

    bool contains(T sample) const { return !(sample < lo) && !(sample > hi); }
    bool validate() const { return !(hi < lo); }
};

template <typename T>
struct ReportFence {
    T min_above{};   // exclusive floor for min candidates
    T max_below{};   // exclusive ceiling for max candidates

    bool validate() const { return min_above < max_below; }
};

// Replaces every sample outside `fence` with the average of the raw
// series, in place. Order and length are preserved. Returns the average
// that was used. Throws EmptySeries for an empty series.
template <typename T>
T sanitize_in_place(std::vector<T>& samples, const SanitizeFence<T>& fence) {
    const T raw_average = series_average(samples);
    for (T& s : samples) {
        if (!fence.contains(s)) s = raw_average;
    }
    return raw_average;
}

// Statistics over `range` with min/max restricted by `fence`.
// avg is taken over every sample in the range. When no sample qualifies
// as a min (or max) candidate the unrestricted bound is reported.
template <typename T>
SeriesStats<T> bounded_stats(const std::vector<T>& samples, IndexRange range,
                             const ReportFence<T>& fence) {
    SeriesStats<T> stats = compute_stats(samples, range);

    bool have_min = false;
    bool have_max = false;
    T min{};
    T max{};
    for (std::size_t i = range.begin; i < range.end; ++i) {
        const T s = samples[i];
        if (s > fence.min_above && (!have_min || s < min)) {
            min = s;
            have_min = true;
        }
        if (s < fence.max_below && (!have_max || s > max)) {
            max = s;
            have_max = true;
        }
    }

    if (have_min) stats.min = min;
    if (have_max) stats.max = max;
    // Degenerate fences can cross over on sparse data
    if (stats.max < stats.min) stats.max = stats.min;
    stats.delta = static_cast<T>(stats.max - stats.min);
    return stats;
}

} // namespace s3bms

#endif // S3BMS_SANITIZER_HPP
