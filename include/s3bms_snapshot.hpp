#ifndef S3BMS_SNAPSHOT_HPP
#define S3BMS_SNAPSHOT_HPP

#include "s3bms_statistics.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace s3bms {

/*
 * ============================================================================
 * SNAPSHOT DATA MODEL
 * ============================================================================
 *
 * The result of one successful poll cycle, consumed read-only by the
 * rendering layer. A new Snapshot replaces the previous one wholesale.
 * ============================================================================
 */

/* ================= PACK-LEVEL READING ================= */

struct MainReading {
    double voltage = 0.0;          // V
    double current = 0.0;          // controller unit (unscaled)
    double state_of_charge = 0.0;  // %
    double temp_avg = 0.0;         // °C
    double temp_min = 0.0;         // °C
    double temp_max = 0.0;         // °C
    double temp_master = 0.0;      // °C, master controller board
};

/* ================= CELL VOLTAGES ================= */

struct CellTopology {
    std::size_t num_slaves = 0;
    std::size_t num_cells = 0;
    std::size_t num_cells_per_slave = 0;
    std::size_t num_temp_sensors = 0;
    std::size_t num_safety_resistors = 0;
};

struct CellVoltageReport {
    CellTopology topology;

    // mV, index = physical cell index
    std::vector<std::uint16_t> cell_voltage;

    VoltageStats overall;
    std::optional<VoltageStats> left;
    std::optional<VoltageStats> right;

    bool sanitized = false;
};

/* ================= CELL TEMPERATURES ================= */

struct CellTemperatureReport {
    // °C, index = sensor index
    std::vector<double> temperature;

    TempStats overall;
    std::optional<TempStats> left;
    std::optional<TempStats> right;

    bool sanitized = false;
};

/* ================= SNAPSHOT ================= */

// Only constructible from all three legs; there is no partial snapshot.
class Snapshot {
    MainReading main_;
    CellVoltageReport cells_;
    CellTemperatureReport temperatures_;

public:
    Snapshot(MainReading main, CellVoltageReport cells, CellTemperatureReport temperatures)
        : main_(std::move(main)),
          cells_(std::move(cells)),
          temperatures_(std::move(temperatures)) {}

    const MainReading& main() const { return main_; }
    const CellVoltageReport& cells() const { return cells_; }
    const CellTemperatureReport& temperatures() const { return temperatures_; }
};

} // namespace s3bms

#endif // S3BMS_SNAPSHOT_HPP
