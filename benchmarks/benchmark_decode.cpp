/*
 * ============================================================================
 * S3 BMS ACQUISITION - DECODE BENCHMARK
 * ============================================================================
 *
 * Cost of turning the three controller pages into a snapshot, without the
 * network: extraction, decoding, sanitizing and aggregation.
 *
 * ============================================================================
 */

#include "s3bms_controller_simulator.hpp"
#include "s3bms_legs.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <cmath>

int main() {
    std::cout << "============================================================================\n";
    std::cout << "S3 BMS DECODE BENCHMARK\n";
    std::cout << "============================================================================\n\n";

    using s3bms::net::join_values;
    using s3bms::net::make_assignment_page;

    std::vector<long long> cells = {0, 0};
    for (int i = 0; i < 144; ++i) {
        cells.push_back(3700 + static_cast<long long>(40.0 * std::sin(i * 0.3)));
    }
    cells[17] = 0;  // one dead tap to sanitize

    std::vector<long long> temps = {0};
    for (int i = 0; i < 16; ++i) temps.push_back(240 + i);

    const std::string main_page = make_assignment_page(
        "Main", {{"Parametersatz", "0,48500,0,0,1500,0,0,650,0,0,250,0,0,210,0,0,320,0,0,400"}});
    const std::string ucell_page = make_assignment_page(
        "Cell Voltages", {{"PSet0", "2,144,72,16,2"}, {"PSet", join_values(cells)}});
    const std::string tcell_page = make_assignment_page(
        "Cell Temperatures", {{"PSet", join_values(temps)}});

    const s3bms::FirmwareProfile profile = s3bms::FirmwareProfile::standard();
    const int NUM_ITERATIONS = 20000;

    std::cout << "Decoding " << NUM_ITERATIONS << " page sets (144 cells, 16 sensors)...\n";

    double checksum = 0.0;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < NUM_ITERATIONS; ++i) {
        auto pack = s3bms::decode_main_document(main_page, profile.main);
        auto volts = s3bms::decode_cell_voltage_document(ucell_page, profile.cell_voltage, true);
        auto temp = s3bms::decode_cell_temperature_document(tcell_page, profile.cell_temperature, true);
        checksum += pack.voltage + volts.overall.delta + temp.overall.avg;
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);

    double total_time_ms = duration.count() / 1000.0;
    double avg_time_us = duration.count() / static_cast<double>(NUM_ITERATIONS);
    double cycles_per_sec = NUM_ITERATIONS / (total_time_ms / 1000.0);

    std::cout << "\n============================================================================\n";
    std::cout << "BENCHMARK RESULTS\n";
    std::cout << "============================================================================\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Total time:        " << total_time_ms << " ms\n";
    std::cout << "Average per cycle: " << avg_time_us << " μs\n";
    std::cout << "Cycles per sec:    " << std::setprecision(0) << cycles_per_sec << " Hz\n";
    std::cout << "Checksum:          " << std::setprecision(1) << checksum << "\n";
    std::cout << "============================================================================\n";

    // The fastest supported poll rate is 100 ms
    if (avg_time_us < 1000.0) {
        std::cout << "✓ EXCELLENT: Decoding is negligible next to the network round trip\n";
    } else if (avg_time_us < 100000.0) {
        std::cout << "✓ GOOD: Fits within the fastest poll rate\n";
    } else {
        std::cout << "⚠  SLOW: Decoding exceeds the fastest poll rate\n";
    }

    return 0;
}
