/*
 * ============================================================================
 * S3 BMS ACQUISITION - LEG PIPELINES
 * ============================================================================
 *
 * A leg is one independent fetch -> extract -> decode -> [sanitize] ->
 * aggregate pipeline:
 *
 *   main              main_data.shtml   pack scalars
 *   cell-voltage      ucell.shtml       topology + per-cell mV
 *   cell-temperature  tcell.shtml       per-sensor °C
 *
 * The decode_*_document() functions are pure and take an already fetched
 * body; the MainLeg, CellVoltageLeg and CellTemperatureLeg runners add the
 * network fetch.
 *
 * LICENSE: MIT
 *
 * ============================================================================
 */

#ifndef S3BMS_LEGS_HPP
#define S3BMS_LEGS_HPP

#include "s3bms_endpoint_fetcher.hpp"
#include "s3bms_field_decoder.hpp"
#include "s3bms_firmware_profile.hpp"
#include "s3bms_interfaces.hpp"
#include "s3bms_pattern_extractor.hpp"
#include "s3bms_sanitizer.hpp"
#include "s3bms_snapshot.hpp"
#include "s3bms_statistics.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace s3bms {

// ============================================================================
// PARTITIONED STATISTICS
// ============================================================================

template <typename T>
struct PartitionedStats {
    SeriesStats<T> overall;
    std::optional<SeriesStats<T>> left;
    std::optional<SeriesStats<T>> right;
};

// overall min/max are the union of the two sides; overall.avg is
// `overall_avg`, the average of the series as received. When the partition
// would leave one side empty only `overall` is produced.
// `fence` is null unless the strict report fence is active.
template <typename T>
PartitionedStats<T> partitioned_stats(const std::vector<T>& samples,
                                      const PartitionSpec& partition,
                                      const ReportFence<T>* fence,
                                      T overall_avg) {
    auto stats_of = [&samples, fence](IndexRange range) {
        return fence ? bounded_stats(samples, range, *fence) : compute_stats(samples, range);
    };

    PartitionedStats<T> out;
    const std::size_t n = samples.size();
    const std::size_t split = partition.split_for(n);

    if (split == 0 || split >= n) {
        out.overall = stats_of(IndexRange{0, n});
        out.overall.avg = overall_avg;
        return out;
    }

    out.right = stats_of(IndexRange{0, split});
    out.left = stats_of(IndexRange{split, n});
    out.overall = merge_bounds(*out.left, *out.right, overall_avg);
    return out;
}

namespace detail {

// Sanitizes in place when asked and returns the raw series average, which
// is both the replacement value and the reported overall average
template <typename T>
T prepare_series(std::vector<T>& samples, const SanitizeFence<T>& fence, bool sanitize) {
    return sanitize ? sanitize_in_place(samples, fence) : series_average(samples);
}

} // namespace detail

// ============================================================================
// DOCUMENT DECODERS
// ============================================================================

inline MainReading decode_main_document(const std::string& body, const MainPlan& plan,
                                        const PatternExtractor& extractor) {
    return decode_main(extractor.extract(body), plan);
}

inline MainReading decode_main_document(const std::string& body, const MainPlan& plan) {
    return decode_main_document(body, plan, *cached_extractor(plan.key));
}

inline CellVoltageReport decode_cell_voltage_document(const std::string& body,
                                                      const CellVoltagePlan& plan,
                                                      bool sanitize,
                                                      const PatternExtractor& topology_extractor,
                                                      const PatternExtractor& array_extractor) {
    CellVoltageReport report;
    report.topology = decode_topology(topology_extractor.extract(body), plan);

    const std::string cells = array_extractor.extract(body);
    report.cell_voltage = decode_array<std::uint16_t>(cells, plan.array_skip, "cell_voltage");

    const std::uint16_t raw_average =
        detail::prepare_series(report.cell_voltage, plan.sanitize_fence, sanitize);
    report.sanitized = sanitize;

    const ReportFence<std::uint16_t>* fence =
        sanitize && plan.report_fence ? &*plan.report_fence : nullptr;

    auto stats = partitioned_stats(report.cell_voltage, plan.partition, fence, raw_average);
    report.overall = stats.overall;
    report.left = stats.left;
    report.right = stats.right;
    return report;
}

inline CellVoltageReport decode_cell_voltage_document(const std::string& body,
                                                      const CellVoltagePlan& plan,
                                                      bool sanitize) {
    return decode_cell_voltage_document(body, plan, sanitize,
                                        *cached_extractor(plan.topology_key),
                                        *cached_extractor(plan.array_key));
}

inline CellTemperatureReport decode_cell_temperature_document(const std::string& body,
                                                              const CellTemperaturePlan& plan,
                                                              bool sanitize,
                                                              const PatternExtractor& extractor) {
    CellTemperatureReport report;

    const std::string payload = extractor.extract(body);
    report.temperature = decode_scaled_array(payload, plan.array_skip, plan.divisor, "temperature");

    const double raw_average =
        detail::prepare_series(report.temperature, plan.sanitize_fence, sanitize);
    report.sanitized = sanitize;

    const ReportFence<double>* fence =
        sanitize && plan.report_fence ? &*plan.report_fence : nullptr;

    auto stats = partitioned_stats(report.temperature, plan.partition, fence, raw_average);
    report.overall = stats.overall;
    report.left = stats.left;
    report.right = stats.right;
    return report;
}

inline CellTemperatureReport decode_cell_temperature_document(const std::string& body,
                                                              const CellTemperaturePlan& plan,
                                                              bool sanitize) {
    return decode_cell_temperature_document(body, plan, sanitize,
                                            *cached_extractor(plan.array_key));
}

// ============================================================================
// LEG RUNNERS
// ============================================================================
//
// A leg owns copies of its plan and references to its extractors for its
// whole run, so it never touches process-wide state after it starts.

class MainLeg {
    MainPlan plan_;
    ExtractorPtr extractor_;

public:
    explicit MainLeg(MainPlan plan)
        : plan_(std::move(plan)), extractor_(cached_extractor(plan_.key)) {}

    MainReading run(IHttpTransport& transport, const std::string& address) const {
        return decode_main_document(fetch_endpoint(transport, address, plan_.resource), plan_,
                                    *extractor_);
    }
};

class CellVoltageLeg {
    CellVoltagePlan plan_;
    bool sanitize_;
    ExtractorPtr topology_extractor_;
    ExtractorPtr array_extractor_;

public:
    CellVoltageLeg(CellVoltagePlan plan, bool sanitize)
        : plan_(std::move(plan)),
          sanitize_(sanitize),
          topology_extractor_(cached_extractor(plan_.topology_key)),
          array_extractor_(cached_extractor(plan_.array_key)) {}

    CellVoltageReport run(IHttpTransport& transport, const std::string& address) const {
        return decode_cell_voltage_document(fetch_endpoint(transport, address, plan_.resource),
                                            plan_, sanitize_, *topology_extractor_,
                                            *array_extractor_);
    }
};

class CellTemperatureLeg {
    CellTemperaturePlan plan_;
    bool sanitize_;
    ExtractorPtr extractor_;

public:
    CellTemperatureLeg(CellTemperaturePlan plan, bool sanitize)
        : plan_(std::move(plan)),
          sanitize_(sanitize),
          extractor_(cached_extractor(plan_.array_key)) {}

    CellTemperatureReport run(IHttpTransport& transport, const std::string& address) const {
        return decode_cell_temperature_document(
            fetch_endpoint(transport, address, plan_.resource), plan_, sanitize_, *extractor_);
    }
};

} // namespace s3bms

#endif // S3BMS_LEGS_HPP
