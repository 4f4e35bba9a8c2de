/*
 * ============================================================================
 * S3 BMS ACQUISITION - FIELD DECODER
 * ============================================================================
 *
 * Payloads are comma-separated and positional: fields carry no labels, so
 * the decode plan (see s3bms_firmware_profile.hpp) must match the firmware
 * layout exactly.
 *
 *   - fewer fields than the plan needs  -> FieldMissing
 *   - a field that is not a number of
 *     the declared type                  -> FieldUnparseable
 *
 * Both carry the zero-based payload position and the field name.
 *
 * LICENSE: MIT
 *
 * ============================================================================
 */

#ifndef S3BMS_FIELD_DECODER_HPP
#define S3BMS_FIELD_DECODER_HPP

#include "s3bms_errors.hpp"
#include "s3bms_firmware_profile.hpp"
#include "s3bms_snapshot.hpp"

#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace s3bms {

// ============================================================================
// NUMBER PARSING
// ============================================================================

inline std::string_view trim(std::string_view text) {
    const char* ws = " \t\r\n";
    auto first = text.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

// Parses the whole of `text` as T. Throws FieldUnparseable on trailing
// garbage, overflow or a value outside T's range.
template <typename T>
T parse_field(std::string_view text, std::size_t index, const std::string& name) {
    static_assert(std::is_arithmetic<T>::value, "fields are numeric");

    const std::string token(trim(text));
    if (token.empty()) throw FieldUnparseable(index, name, std::string(text));

    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;

    if constexpr (std::is_floating_point<T>::value) {
        double value = std::strtod(begin, &end);
        if (end != begin + token.size() || errno == ERANGE || !std::isfinite(value)) {
            throw FieldUnparseable(index, name, token);
        }
        return static_cast<T>(value);
    } else if constexpr (std::is_signed<T>::value) {
        long long value = std::strtoll(begin, &end, 10);
        if (end != begin + token.size() || errno == ERANGE ||
            value < static_cast<long long>(std::numeric_limits<T>::min()) ||
            value > static_cast<long long>(std::numeric_limits<T>::max())) {
            throw FieldUnparseable(index, name, token);
        }
        return static_cast<T>(value);
    } else {
        // strtoull silently negates "-5"
        if (token[0] == '-') throw FieldUnparseable(index, name, token);
        unsigned long long value = std::strtoull(begin, &end, 10);
        if (end != begin + token.size() || errno == ERANGE ||
            value > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            throw FieldUnparseable(index, name, token);
        }
        return static_cast<T>(value);
    }
}

// ============================================================================
// FIELD CURSOR
// ============================================================================
//
// Walks the fields of a payload in order. The payload must outlive the
// cursor.

class FieldCursor {
    std::vector<std::string_view> fields_;
    std::size_t index_ = 0;

public:
    explicit FieldCursor(std::string_view payload) {
        if (payload.empty()) return;

        std::size_t start = 0;
        while (true) {
            auto comma = payload.find(',', start);
            if (comma == std::string_view::npos) {
                fields_.push_back(payload.substr(start));
                break;
            }
            fields_.push_back(payload.substr(start, comma - start));
            start = comma + 1;
        }
    }

    std::size_t size() const { return fields_.size(); }
    std::size_t index() const { return index_; }
    std::size_t remaining() const { return index_ < fields_.size() ? fields_.size() - index_ : 0; }
    bool at_end() const { return remaining() == 0; }

    // Running past the end is only reported by the next read
    void skip(std::size_t count) { index_ += count; }

    std::string_view next_raw(const std::string& name) {
        if (index_ >= fields_.size()) throw FieldMissing(index_, name);
        return fields_[index_++];
    }

    template <typename T>
    T next(const std::string& name) {
        const std::size_t at = index_;
        return parse_field<T>(next_raw(name), at, name);
    }

    double next_scaled(const FieldSpec& spec) {
        skip(spec.skip);
        return next<double>(spec.name) / spec.divisor;
    }
};

// ============================================================================
// TYPED DECODERS
// ============================================================================

inline MainReading decode_main(std::string_view payload, const MainPlan& plan) {
    FieldCursor cursor(payload);

    MainReading r;
    r.voltage = cursor.next_scaled(plan.fields[0]);
    r.current = cursor.next_scaled(plan.fields[1]);
    r.state_of_charge = cursor.next_scaled(plan.fields[2]);
    r.temp_avg = cursor.next_scaled(plan.fields[3]);
    r.temp_min = cursor.next_scaled(plan.fields[4]);
    r.temp_max = cursor.next_scaled(plan.fields[5]);
    r.temp_master = cursor.next_scaled(plan.fields[6]);
    return r;
}

inline CellTopology decode_topology(std::string_view payload, const CellVoltagePlan& plan) {
    FieldCursor cursor(payload);

    auto read = [&cursor](const FieldSpec& spec) {
        cursor.skip(spec.skip);
        return cursor.next<std::size_t>(spec.name);
    };

    CellTopology t;
    t.num_slaves = read(plan.topology_fields[0]);
    t.num_cells = read(plan.topology_fields[1]);
    t.num_cells_per_slave = read(plan.topology_fields[2]);
    t.num_temp_sensors = read(plan.topology_fields[3]);
    t.num_safety_resistors = read(plan.topology_fields[4]);
    return t;
}

// Repeated values after `skip` leading fields. A single trailing empty
// field (payload ending in ',') is ignored; any other empty or
// non-numeric field is FieldUnparseable.
template <typename T>
std::vector<T> decode_array(std::string_view payload, std::size_t skip, const std::string& name) {
    FieldCursor cursor(payload);
    if (skip > cursor.size()) throw FieldMissing(cursor.size(), name + " header");
    cursor.skip(skip);

    std::vector<T> values;
    values.reserve(cursor.remaining());
    while (!cursor.at_end()) {
        const std::size_t at = cursor.index();
        const std::string element = name + "[" + std::to_string(values.size()) + "]";
        std::string_view raw = cursor.next_raw(element);
        if (cursor.at_end() && trim(raw).empty()) break;
        values.push_back(parse_field<T>(raw, at, element));
    }
    return values;
}

// Integer raw values divided by `divisor`, e.g. tenths of a degree
inline std::vector<double> decode_scaled_array(std::string_view payload, std::size_t skip,
                                               double divisor, const std::string& name) {
    std::vector<long long> raw = decode_array<long long>(payload, skip, name);

    std::vector<double> values;
    values.reserve(raw.size());
    for (long long v : raw) {
        values.push_back(static_cast<double>(v) / divisor);
    }
    return values;
}

} // namespace s3bms

#endif // S3BMS_FIELD_DECODER_HPP
