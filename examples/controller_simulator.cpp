/*
 * ============================================================================
 * S3 BMS CONTROLLER SIMULATOR - EXAMPLE APPLICATION
 * ============================================================================
 *
 * Serves a synthetic 144-cell, 16-sensor pack in the controller's page
 * format so the dashboard poller can be tried without hardware. Values
 * drift slowly; every 15 s one cell tap glitches to 0 mV for a few
 * seconds to exercise the sanitizer.
 *
 * Compile:
 *   g++ -std=c++17 -O2 -Iinclude -Isrc examples/controller_simulator.cpp -o controller_simulator -lpthread
 *
 * Run:
 *   ./controller_simulator [port]          (default 8080)
 *   ./dashboard_poller 127.0.0.1:8080
 *
 * Test endpoints:
 *   curl http://localhost:8080/main_data.shtml
 *   curl http://localhost:8080/ucell.shtml
 *   curl http://localhost:8080/tcell.shtml
 *
 * ============================================================================
 */

#include "s3bms_controller_simulator.hpp"

#include <iostream>
#include <algorithm>
#include <cmath>
#include <chrono>
#include <thread>
#include <csignal>
#include <atomic>
#include <cstdlib>
#include <vector>

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "\nReceived shutdown signal, stopping simulator...\n";
        g_running.store(false);
    }
}

// ============================================================================
// SIMULATED PACK
// ============================================================================

constexpr int NUM_SLAVES = 2;
constexpr int CELLS_PER_SLAVE = 72;
constexpr int NUM_CELLS = NUM_SLAVES * CELLS_PER_SLAVE;
constexpr int NUM_TEMP_SENSORS = 16;

struct PackState {
    std::vector<long long> cell_mv;
    std::vector<long long> temp_tenths;
    double voltage_v = 0.0;
    double current = 0.0;
    double soc_percent = 0.0;
};

PackState simulate_pack(double time) {
    PackState pack;

    // Slow charge/discharge swing around 65 % SoC
    pack.soc_percent = 65.0 + 20.0 * std::sin(time * 0.02);
    const double base_mv = 3550.0 + 6.0 * pack.soc_percent;

    for (int i = 0; i < NUM_CELLS; ++i) {
        // Per-cell manufacturing spread plus a little noise
        double spread = 15.0 * std::sin(i * 0.37) + 4.0 * std::sin(time * 0.9 + i);
        pack.cell_mv.push_back(static_cast<long long>(base_mv + spread));
    }

    // Periodic dead tap on one cell
    const int phase = static_cast<int>(time) % 15;
    if (phase < 3) {
        pack.cell_mv[static_cast<std::size_t>(static_cast<int>(time / 15.0) % NUM_CELLS)] = 0;
    }

    for (int i = 0; i < NUM_TEMP_SENSORS; ++i) {
        double t = 24.0 + 3.0 * std::sin(time * 0.05 + i * 0.4) + (i < 8 ? 0.0 : 1.5);
        pack.temp_tenths.push_back(static_cast<long long>(std::lround(t * 10.0)));
    }

    long long sum_mv = 0;
    for (long long mv : pack.cell_mv) sum_mv += mv;
    pack.voltage_v = sum_mv / 1000.0 / NUM_SLAVES;  // strings in parallel
    pack.current = 40.0 * std::sin(time * 0.02 + 1.5);
    return pack;
}

// Renders the three controller pages for one pack state
void publish(s3bms::net::ControllerSimulator& sim, const PackState& pack) {
    using s3bms::net::join_values;
    using s3bms::net::make_assignment_page;

    long long t_min = pack.temp_tenths.front();
    long long t_max = pack.temp_tenths.front();
    long long t_sum = 0;
    for (long long t : pack.temp_tenths) {
        t_min = std::min(t_min, t);
        t_max = std::max(t_max, t);
        t_sum += t;
    }
    const long long t_avg = t_sum / static_cast<long long>(pack.temp_tenths.size());

    // Scalars interleaved with fields the dashboard does not read
    std::vector<long long> scalars = {
        0, std::lround(pack.voltage_v * 1000.0),
        0, 0, std::lround(pack.current),
        0, 0, std::lround(pack.soc_percent * 10.0),
        0, 0, t_avg,
        0, 0, t_min,
        0, 0, t_max,
        0, 0, t_max + 40,
    };
    sim.set_page("main_data.shtml",
                 make_assignment_page("Main", {{"Parametersatz", join_values(scalars)}}));

    std::vector<long long> topology = {NUM_SLAVES, NUM_CELLS, CELLS_PER_SLAVE,
                                       NUM_TEMP_SENSORS, 2};
    std::vector<long long> cells = {0, 0};
    cells.insert(cells.end(), pack.cell_mv.begin(), pack.cell_mv.end());
    sim.set_page("ucell.shtml",
                 make_assignment_page("Cell Voltages", {{"PSet0", join_values(topology)},
                                                        {"PSet", join_values(cells) + ","}}));

    std::vector<long long> temps = {0};
    temps.insert(temps.end(), pack.temp_tenths.begin(), pack.temp_tenths.end());
    sim.set_page("tcell.shtml",
                 make_assignment_page("Cell Temperatures", {{"PSet", join_values(temps)}}));
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const int port = argc > 1 ? std::atoi(argv[1]) : 8080;

    std::cout << "============================================================================\n";
    std::cout << "S3 BMS CONTROLLER SIMULATOR\n";
    std::cout << "============================================================================\n";

    s3bms::net::ControllerSimulator sim("0.0.0.0", port);
    publish(sim, simulate_pack(0.0));

    if (!sim.start()) {
        std::cerr << "Failed to start simulator on port " << port << "\n";
        return 1;
    }

    std::cout << "Serving " << NUM_CELLS << " cells and " << NUM_TEMP_SENSORS
              << " sensors on port " << sim.port() << "\n";
    std::cout << "Press Ctrl+C to stop\n\n";

    const auto start = std::chrono::steady_clock::now();
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        const double time = std::chrono::duration<double>(
                                std::chrono::steady_clock::now() - start).count();
        publish(sim, simulate_pack(time));
    }

    sim.stop();

    auto stats = sim.get_stats();
    std::cout << "Requests: " << stats.total_requests
              << " (ok " << stats.successful_requests
              << ", failed " << stats.failed_requests << ")\n";
    return 0;
}
