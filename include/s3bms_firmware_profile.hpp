/*
 * ============================================================================
 * S3 BMS ACQUISITION - FIRMWARE PROFILES
 * ============================================================================
 *
 * Field positions, scale factors, partitions and plausibility fences are a
 * private contract with the controller firmware. They differ between
 * firmware revisions, so they are data, not code: supporting a new
 * revision means adding a profile here.
 *
 * A FieldSpec reads as: discard `skip` unlabelled fields, then read one
 * number and divide it by `divisor`.
 *
 * LICENSE: MIT
 *
 * ============================================================================
 */

#ifndef S3BMS_FIRMWARE_PROFILE_HPP
#define S3BMS_FIRMWARE_PROFILE_HPP

#include "s3bms_sanitizer.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace s3bms {

// ============================================================================
// DECODE PLANS
// ============================================================================

struct FieldSpec {
    std::string name;
    std::size_t skip = 0;
    double divisor = 1.0;
};

struct PartitionSpec {
    enum class Mode { NONE, FIXED_INDEX, HALVES };

    Mode mode = Mode::NONE;
    std::size_t split_index = 0;  // FIXED_INDEX only

    // First segment [0, split) is the right string, the rest the left one.
    // Returns `length` when there is no split.
    std::size_t split_for(std::size_t length) const {
        switch (mode) {
            case Mode::FIXED_INDEX: return split_index < length ? split_index : length;
            case Mode::HALVES: return length / 2;
            case Mode::NONE: break;
        }
        return length;
    }
};

// Field order: voltage, current, state_of_charge, temp_avg, temp_min,
// temp_max, temp_master
struct MainPlan {
    std::string resource = "main_data.shtml";
    std::string key = "Parametersatz";
    std::array<FieldSpec, 7> fields{{
        {"voltage", 1, 1000.0},
        {"current", 2, 1.0},
        {"state_of_charge", 2, 10.0},
        {"temp_avg", 2, 10.0},
        {"temp_min", 2, 10.0},
        {"temp_max", 2, 10.0},
        {"temp_master", 2, 10.0},
    }};

    bool validate() const {
        if (resource.empty() || key.empty()) return false;
        for (const auto& f : fields) {
            if (f.name.empty() || !(f.divisor > 0.0)) return false;
        }
        return true;
    }
};

// Field order: slaves, cells, cells per slave, temp sensors, safety resistors
struct CellVoltagePlan {
    std::string resource = "ucell.shtml";
    std::string topology_key = "PSet0";
    std::array<FieldSpec, 5> topology_fields{{
        {"num_slaves", 0, 1.0},
        {"num_cells", 0, 1.0},
        {"num_cells_per_slave", 0, 1.0},
        {"num_temp_sensors", 0, 1.0},
        {"num_safety_resistors", 0, 1.0},
    }};

    std::string array_key = "PSet";
    std::size_t array_skip = 2;

    PartitionSpec partition{PartitionSpec::Mode::FIXED_INDEX, 72};
    SanitizeFence<std::uint16_t> sanitize_fence{3000, 4200};
    std::optional<ReportFence<std::uint16_t>> report_fence;

    bool validate() const {
        if (resource.empty() || topology_key.empty() || array_key.empty()) return false;
        if (topology_key == array_key) return false;
        if (!sanitize_fence.validate()) return false;
        if (report_fence && !report_fence->validate()) return false;
        return true;
    }
};

struct CellTemperaturePlan {
    std::string resource = "tcell.shtml";
    std::string array_key = "PSet";
    std::size_t array_skip = 1;
    double divisor = 10.0;  // tenths of a degree

    PartitionSpec partition{PartitionSpec::Mode::FIXED_INDEX, 8};
    SanitizeFence<double> sanitize_fence{15.0, 45.0};
    std::optional<ReportFence<double>> report_fence;

    bool validate() const {
        if (resource.empty() || array_key.empty()) return false;
        if (!(divisor > 0.0)) return false;
        if (!sanitize_fence.validate()) return false;
        if (report_fence && !report_fence->validate()) return false;
        return true;
    }
};

// ============================================================================
// PROFILES
// ============================================================================

struct FirmwareProfile {
    std::string name = "standard";
    MainPlan main;
    CellVoltagePlan cell_voltage;
    CellTemperaturePlan cell_temperature;

    bool validate() const {
        return !name.empty() && main.validate() && cell_voltage.validate() &&
               cell_temperature.validate();
    }

    // 144-cell pack split 72/72, 16 sensors split 8/8, replacement fence only
    static FirmwareProfile standard() {
        return FirmwareProfile{};
    }

    // Fixed halves, plus a tighter report fence for the displayed bounds
    static FirmwareProfile strict() {
        FirmwareProfile p;
        p.name = "strict";
        p.cell_voltage.partition = PartitionSpec{PartitionSpec::Mode::HALVES, 0};
        p.cell_voltage.report_fence = ReportFence<std::uint16_t>{3690, 4210};
        p.cell_temperature.partition = PartitionSpec{PartitionSpec::Mode::HALVES, 0};
        return p;
    }
};

inline std::vector<std::string> profile_names() {
    return {"standard", "strict"};
}

inline FirmwareProfile profile_by_name(const std::string& name) {
    if (name == "standard") return FirmwareProfile::standard();
    if (name == "strict") return FirmwareProfile::strict();
    throw std::invalid_argument("Unknown firmware profile: " + name);
}

} // namespace s3bms

#endif // S3BMS_FIRMWARE_PROFILE_HPP
