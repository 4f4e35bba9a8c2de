/*
 * ============================================================================
 * S3 BMS DASHBOARD POLLER - EXAMPLE APPLICATION
 * ============================================================================
 *
 * Polls a BMS controller and prints each new snapshot as a text dashboard:
 * pack scalars, per-string statistics and the cell voltages nine to a row.
 * A failed or stalled cycle prints the fault and keeps the last snapshot.
 *
 * Compile:
 *   g++ -std=c++17 -O2 -Iinclude -Isrc examples/dashboard_poller.cpp -o dashboard_poller -lpthread
 *
 * Run:
 *   ./dashboard_poller 192.168.0.200
 *   ./dashboard_poller 127.0.0.1:8080 --rate 1000 --profile strict --cycles 10
 *
 * Options:
 *   --rate <ms>           poll rate, clamped to 100..10000 (default 2000)
 *   --no-sanitize         show raw values, outliers included
 *   --profile <name>      firmware profile: standard | strict
 *   --cycles <n>          exit after n completed or failed cycles (0 = forever)
 *   --abandon-after <ms>  drop a cycle still running after this long (0 = never)
 *
 * ============================================================================
 */

#include "s3bms.hpp"

#include <iostream>
#include <iomanip>
#include <chrono>
#include <thread>
#include <csignal>
#include <atomic>
#include <cstdlib>
#include <string>

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "\nReceived shutdown signal, stopping poller...\n";
        g_running.store(false);
    }
}

// ============================================================================
// COMMAND LINE
// ============================================================================

struct CliOptions {
    s3bms::PollerSettings settings;
    unsigned long cycles = 0;
};

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " <address> [--rate ms] [--no-sanitize] [--profile name]"
                 " [--cycles n] [--abandon-after ms]\n";
}

bool parse_int(const std::string& text, long& out) {
    char* end = nullptr;
    out = std::strtol(text.c_str(), &end, 10);
    return !text.empty() && *end == '\0';
}

bool parse_cli(int argc, char** argv, CliOptions& cli) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](long& out) {
            return i + 1 < argc && parse_int(argv[++i], out);
        };
        long n = 0;

        if (arg == "--rate") {
            if (!value(n)) return false;
            cli.settings.poll_rate_ms = s3bms::PollerSettings::clamp_poll_rate(n);
        } else if (arg == "--no-sanitize") {
            cli.settings.sanitize = false;
        } else if (arg == "--profile") {
            if (i + 1 >= argc) return false;
            cli.settings.profile = argv[++i];
        } else if (arg == "--cycles") {
            if (!value(n) || n < 0) return false;
            cli.cycles = static_cast<unsigned long>(n);
        } else if (arg == "--abandon-after") {
            if (!value(n)) return false;
            cli.settings.abandon_after_ms = s3bms::PollerSettings::clamp_abandon_after(n);
        } else if (!arg.empty() && arg[0] == '-') {
            return false;
        } else {
            cli.settings.address = arg;
        }
    }
    cli.settings.clamp();
    return true;
}

// ============================================================================
// RENDERING
// ============================================================================

template <typename T>
void print_stats_row(const std::string& label, const s3bms::SeriesStats<T>& s) {
    std::cout << "  " << std::left << std::setw(8) << label << std::right
              << " avg " << std::setw(7) << s.avg
              << "  min " << std::setw(7) << s.min
              << "  max " << std::setw(7) << s.max
              << "  delta " << std::setw(6) << s.delta << "\n";
}

template <typename Report>
void print_partitions(const Report& report) {
    print_stats_row("overall", report.overall);
    if (report.right) print_stats_row("right", *report.right);
    if (report.left) print_stats_row("left", *report.left);
}

void print_snapshot(const s3bms::Snapshot& snapshot) {
    const auto& m = snapshot.main();
    const auto& cells = snapshot.cells();
    const auto& temps = snapshot.temperatures();

    std::cout << "\n============================================================================\n";
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "PACK   " << m.voltage << " V   " << std::setprecision(0) << m.current
              << " (current)   SoC " << std::setprecision(1) << m.state_of_charge << " %\n";
    std::cout << "TEMP   avg " << m.temp_avg << "  min " << m.temp_min
              << "  max " << m.temp_max << "  master " << m.temp_master << " °C\n";
    std::cout << "TOPOLOGY  " << cells.topology.num_slaves << " slaves, "
              << cells.topology.num_cells << " cells ("
              << cells.topology.num_cells_per_slave << "/slave), "
              << cells.topology.num_temp_sensors << " temp sensors, "
              << cells.topology.num_safety_resistors << " safety resistors\n";

    std::cout << "\nCELL VOLTAGES [mV]" << (cells.sanitized ? "" : " (raw)") << "\n";
    print_partitions(cells);

    std::cout << "\nCELL TEMPERATURES [°C]" << (temps.sanitized ? "" : " (raw)") << "\n";
    print_partitions(temps);

    std::cout << "\n";
    const std::size_t per_row = 9;
    for (std::size_t i = 0; i < cells.cell_voltage.size(); ++i) {
        if (i % per_row == 0) std::cout << "  " << std::setw(3) << i << " |";
        std::cout << " " << std::setw(4) << cells.cell_voltage[i];
        if (i % per_row == per_row - 1 || i + 1 == cells.cell_voltage.size()) std::cout << "\n";
    }
    std::cout << "============================================================================\n";
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char** argv) {
    CliOptions cli;
    if (!parse_cli(argc, argv, cli)) {
        print_usage(argv[0]);
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "============================================================================\n";
    std::cout << "S3 BMS DASHBOARD POLLER v" << s3bms::get_version_string() << "\n";
    std::cout << "============================================================================\n";
    std::cout << "Controller: " << cli.settings.address << "\n";
    std::cout << "Poll rate:  " << cli.settings.poll_rate_ms << " ms\n";
    std::cout << "Profile:    " << cli.settings.profile
              << (cli.settings.sanitize ? " (sanitized)" : " (raw)") << "\n";
    std::cout << "Press Ctrl+C to stop\n";

    try {
        auto logger = std::make_shared<s3bms::ConsoleLogger>(std::cerr, "poller");
        auto transport = std::make_shared<s3bms::net::PosixHttpTransport>();
        s3bms::DashboardPoller poller(cli.settings, transport,
                                      std::make_shared<s3bms::SteadyTimeSource>(), logger);

        while (g_running.load()) {
            switch (poller.tick()) {
                case s3bms::DashboardPoller::TickResult::UPDATED:
                    print_snapshot(*poller.snapshot());
                    break;
                case s3bms::DashboardPoller::TickResult::FAILED:
                case s3bms::DashboardPoller::TickResult::ABANDONED:
                    std::cout << "\n⚠  " << s3bms::to_string(poller.fault()->kind) << ": "
                              << poller.fault()->message << "\n";
                    if (poller.snapshot()) {
                        std::cout << "   (showing previous snapshot)\n";
                    }
                    break;
                default:
                    break;
            }

            const unsigned long done = poller.cycles_completed() + poller.cycles_failed();
            if (cli.cycles > 0 && done >= cli.cycles) break;

            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        std::cout << "\nCycles completed: " << poller.cycles_completed()
                  << ", failed: " << poller.cycles_failed() << "\n";
        return poller.cycles_failed() > 0 && poller.cycles_completed() == 0 ? 1 : 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Error: " << e.what() << "\n";
        return 1;
    }
}
