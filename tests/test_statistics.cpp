/*
 * ============================================================================
 * S3 BMS ACQUISITION - STATISTICS AND SANITIZER TESTS
 * ============================================================================
 */

#include "s3bms_legs.hpp"
#include "s3bms_sanitizer.hpp"
#include "s3bms_statistics.hpp"
#include "test_support.hpp"

#include <iostream>
#include <cassert>
#include <cmath>
#include <algorithm>
#include <numeric>
#include <random>

using namespace s3bms;
using s3bms_test::throws;

bool test_stats_match_reference() {
    std::cout << "Testing aggregation against a reference over random packs..." << std::flush;

    std::mt19937 rng(42);
    std::uniform_int_distribution<int> mv(2900, 4300);
    std::uniform_int_distribution<int> len(1, 200);

    for (int round = 0; round < 200; ++round) {
        std::vector<std::uint16_t> cells(static_cast<std::size_t>(len(rng)));
        for (auto& c : cells) c = static_cast<std::uint16_t>(mv(rng));

        VoltageStats s = compute_stats(cells);
        const auto mm = std::minmax_element(cells.begin(), cells.end());
        const unsigned long long sum =
            std::accumulate(cells.begin(), cells.end(), 0ULL);

        assert(s.min == *mm.first);
        assert(s.max == *mm.second);
        assert(s.delta == s.max - s.min);
        assert(s.avg == sum / cells.size());
        assert(s.min <= s.avg && s.avg <= s.max);
    }

    std::cout << " PASS\n";
    return true;
}

bool test_integer_average_truncates() {
    std::cout << "Testing integer average truncates..." << std::flush;

    std::vector<std::uint16_t> cells = {1, 2};
    assert(compute_stats(cells).avg == 1);
    assert(series_average(cells) == 1);

    std::vector<std::uint16_t> pack = {3700, 3701, 3701};
    assert(compute_stats(pack).avg == 3700);

    // 144 cells at the 16-bit ceiling must not overflow the sum
    std::vector<std::uint16_t> saturated(144, 65535);
    assert(series_average(saturated) == 65535);

    std::cout << " PASS\n";
    return true;
}

bool test_floating_average_is_exact() {
    std::cout << "Testing floating average is the true mean..." << std::flush;

    std::vector<double> temps = {20.0, 21.0};
    TempStats s = compute_stats(temps);
    assert(s.avg == 20.5);
    assert(s.min == 20.0);
    assert(s.max == 21.0);
    assert(s.delta == 1.0);

    std::cout << " PASS\n";
    return true;
}

bool test_range_preconditions() {
    std::cout << "Testing empty and out-of-range requests..." << std::flush;

    std::vector<std::uint16_t> none;
    assert(throws<EmptySeries>([&] { compute_stats(none); }));
    assert(throws<EmptySeries>([&] { series_average(none); }));

    std::vector<std::uint16_t> cells = {3700, 3710, 3720};
    assert(throws<EmptySeries>([&] { compute_stats(cells, IndexRange{1, 1}); }));
    assert(throws<std::out_of_range>([&] { compute_stats(cells, IndexRange{0, 4}); }));
    assert(throws<std::out_of_range>([&] { compute_stats(cells, IndexRange{2, 1}); }));

    VoltageStats tail = compute_stats(cells, IndexRange{1, 3});
    assert(tail.min == 3710 && tail.max == 3720 && tail.avg == 3715);

    std::cout << " PASS\n";
    return true;
}

bool test_sanitize_replaces_outliers() {
    std::cout << "Testing outliers are replaced by the raw average..." << std::flush;

    std::vector<std::uint16_t> cells = {3000, 4200, 3700, 5000};
    const std::uint16_t used = sanitize_in_place(cells, SanitizeFence<std::uint16_t>{3000, 4200});

    // Fence is inclusive: 3000 and 4200 survive
    assert(used == 3975);
    assert(cells.size() == 4);
    assert(cells[0] == 3000);
    assert(cells[1] == 4200);
    assert(cells[2] == 3700);
    assert(cells[3] == 3975);

    std::cout << " PASS\n";
    return true;
}

bool test_single_outlier_in_healthy_pack() {
    std::cout << "Testing a lone dead tap leaves the rest untouched..." << std::flush;

    std::vector<std::uint16_t> cells(144, 3750);
    cells[57] = 0;
    std::vector<std::uint16_t> before = cells;

    sanitize_in_place(cells, SanitizeFence<std::uint16_t>{3000, 4200});

    // (143 * 3750) / 144 truncated
    assert(cells[57] == 3723);
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i != 57) assert(cells[i] == before[i]);
    }

    std::cout << " PASS\n";
    return true;
}

bool test_sanitize_is_idempotent() {
    std::cout << "Testing sanitizing twice changes nothing..." << std::flush;

    std::mt19937 rng(7);
    std::uniform_int_distribution<int> healthy(3300, 4100);
    std::uniform_int_distribution<int> glitch(0, 9);
    const SanitizeFence<std::uint16_t> fence{3000, 4200};

    for (int round = 0; round < 100; ++round) {
        std::vector<std::uint16_t> cells(144);
        for (auto& c : cells) {
            // Roughly one in ten taps glitches high
            c = static_cast<std::uint16_t>(glitch(rng) == 0 ? 4400 : healthy(rng));
        }

        sanitize_in_place(cells, fence);
        for (auto c : cells) assert(fence.contains(c));

        std::vector<std::uint16_t> once = cells;
        sanitize_in_place(cells, fence);
        assert(cells == once);
    }

    std::cout << " PASS\n";
    return true;
}

bool test_bounded_stats() {
    std::cout << "Testing report fence restricts displayed bounds..." << std::flush;

    std::vector<std::uint16_t> cells = {3500, 3800, 4000, 4205, 4215};
    const ReportFence<std::uint16_t> fence{3690, 4210};

    VoltageStats s = bounded_stats(cells, IndexRange{0, cells.size()}, fence);
    assert(s.min == 3800);
    assert(s.max == 4205);
    assert(s.avg == 3944);  // average still covers every sample
    assert(s.delta == 405);

    std::cout << " PASS\n";
    return true;
}

bool test_bounded_stats_fallback() {
    std::cout << "Testing report fence falls back when nothing qualifies..." << std::flush;

    const ReportFence<std::uint16_t> fence{3690, 4210};

    // No min candidate above 3690
    std::vector<std::uint16_t> low = {3600, 3650};
    VoltageStats a = bounded_stats(low, IndexRange{0, low.size()}, fence);
    assert(a.min == 3600);
    assert(a.max == 3650);

    // No max candidate below 4210
    std::vector<std::uint16_t> high = {4300, 4250};
    VoltageStats b = bounded_stats(high, IndexRange{0, high.size()}, fence);
    assert(b.min == 4250);
    assert(b.max == 4300);

    // Crossed candidates never report max below min
    std::vector<std::uint16_t> sparse = {3600, 3700};
    VoltageStats c = bounded_stats(sparse, IndexRange{0, sparse.size()},
                                   ReportFence<std::uint16_t>{3650, 3620});
    assert(c.min == 3700);
    assert(c.max == 3700);
    assert(c.delta == 0);

    std::cout << " PASS\n";
    return true;
}

bool test_partition_union() {
    std::cout << "Testing overall bounds are the union of both strings..." << std::flush;

    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> mv(3000, 4200);
    const PartitionSpec fixed{PartitionSpec::Mode::FIXED_INDEX, 72};

    for (int round = 0; round < 50; ++round) {
        std::vector<std::uint16_t> cells(144);
        for (auto& c : cells) c = static_cast<std::uint16_t>(mv(rng));

        auto p = partitioned_stats<std::uint16_t>(cells, fixed, nullptr, series_average(cells));
        assert(p.left && p.right);
        assert(p.overall.min == std::min(p.left->min, p.right->min));
        assert(p.overall.max == std::max(p.left->max, p.right->max));
        assert(p.overall.delta == p.overall.max - p.overall.min);
        assert(p.overall.avg == series_average(cells));

        VoltageStats right = compute_stats(cells, IndexRange{0, 72});
        assert(p.right->min == right.min && p.right->max == right.max);
    }

    std::cout << " PASS\n";
    return true;
}

bool test_partition_modes() {
    std::cout << "Testing partition modes..." << std::flush;

    std::vector<double> temps = {20.0, 21.0, 30.0, 31.0, 32.0};

    const double temps_avg = series_average(temps);
    auto halves = partitioned_stats<double>(
        temps, PartitionSpec{PartitionSpec::Mode::HALVES, 0}, nullptr, temps_avg);
    assert(halves.right && halves.left);
    assert(halves.right->max == 21.0);   // [20, 21]
    assert(halves.left->min == 30.0);    // [30, 31, 32]
    assert(halves.overall.delta == 12.0);
    assert(std::abs(halves.overall.avg - 26.8) < 1e-9);

    auto none = partitioned_stats<double>(temps, PartitionSpec{}, nullptr, temps_avg);
    assert(!none.left && !none.right);
    assert(none.overall.min == 20.0 && none.overall.max == 32.0);

    // A split at or beyond the end degrades to overall only
    auto beyond = partitioned_stats<double>(
        temps, PartitionSpec{PartitionSpec::Mode::FIXED_INDEX, 5}, nullptr, temps_avg);
    assert(!beyond.left && !beyond.right);

    // A single sample cannot be halved
    std::vector<double> one = {25.0};
    auto single = partitioned_stats<double>(
        one, PartitionSpec{PartitionSpec::Mode::HALVES, 0}, nullptr, 25.0);
    assert(!single.left && single.overall.avg == 25.0);

    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "S3 BMS STATISTICS TESTS\n";
    std::cout << "============================================================================\n\n";

    try {
        bool all_passed = true;

        all_passed &= test_stats_match_reference();
        all_passed &= test_integer_average_truncates();
        all_passed &= test_floating_average_is_exact();
        all_passed &= test_range_preconditions();
        all_passed &= test_sanitize_replaces_outliers();
        all_passed &= test_single_outlier_in_healthy_pack();
        all_passed &= test_sanitize_is_idempotent();
        all_passed &= test_bounded_stats();
        all_passed &= test_bounded_stats_fallback();
        all_passed &= test_partition_union();
        all_passed &= test_partition_modes();

        std::cout << "\n============================================================================\n";
        if (all_passed) {
            std::cout << "✓ All statistics tests PASSED\n";
        } else {
            std::cout << "✗ Some tests FAILED\n";
            return 1;
        }
        std::cout << "============================================================================\n";

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
