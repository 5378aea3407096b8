// ==============================================================================
// Unit Tests: QuickLyapunov
// ==============================================================================

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "chaos/quick_lyapunov.h"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace chaos;
using namespace std::chrono_literals;
using Catch::Approx;

namespace {

// Points on a line whose successive gaps grow by exp(rate * dt)
std::vector<TrajectorySample> exponentialRun(size_t n, double rate, double dt) {
    std::vector<TrajectorySample> samples;
    for (size_t i = 0; i < n; ++i) {
        double t = i * dt;
        samples.push_back({{std::exp(rate * t), 0.0, 0.0}, {}, t});
    }
    return samples;
}

} // namespace

TEST_CASE("separationGrowthRate recovers exponential gap growth", "[chaos][quick]") {
    auto samples = exponentialRun(101, 0.3, 0.01);
    // 99 ratios over 100 intervals of elapsed time
    REQUIRE(separationGrowthRate(samples) == Approx(0.3 * 99.0 / 100.0).epsilon(1e-9));
}

TEST_CASE("separationGrowthRate degenerate input", "[chaos][quick]") {
    SECTION("fewer than three samples") {
        auto samples = exponentialRun(2, 0.3, 0.01);
        REQUIRE(separationGrowthRate(samples) == 0.0);
        REQUIRE(separationGrowthRate({}) == 0.0);
    }

    SECTION("no elapsed time") {
        std::vector<TrajectorySample> samples(5);
        for (size_t i = 0; i < samples.size(); ++i) {
            samples[i].position = {static_cast<double>(i * i), 0.0, 0.0};
        }
        REQUIRE(separationGrowthRate(samples) == 0.0);
    }

    SECTION("repeated points are skipped") {
        std::vector<TrajectorySample> samples(6);
        for (size_t i = 0; i < samples.size(); ++i) {
            samples[i].timestamp = static_cast<double>(i);
        }
        REQUIRE(separationGrowthRate(samples) == 0.0);
    }
}

TEST_CASE("QuickLyapunov reads only the newest window", "[chaos][quick]") {
    TrajectoryStore store(500);
    // Old samples shrink, the newest 50 grow at rate 0.5
    for (auto const& s : exponentialRun(200, -0.8, 0.01)) {
        store.push(s);
    }
    double offset = store.back().position[0];
    for (auto s : exponentialRun(50, 0.5, 0.01)) {
        s.position[0] += offset + 10.0;
        s.timestamp += 10.0;
        store.push(s);
    }

    QuickLyapunov quick(50, 1000ms);
    auto now = QuickLyapunov::Clock::now();
    REQUIRE(quick.estimate(store, now) == Approx(0.5 * 48.0 / 49.0).epsilon(1e-9));
}

TEST_CASE("QuickLyapunov caches for its interval", "[chaos][quick]") {
    TrajectoryStore store(100);
    for (auto const& s : exponentialRun(100, 0.2, 0.01)) {
        store.push(s);
    }

    QuickLyapunov quick(20, 500ms);
    auto t0 = QuickLyapunov::Clock::now();
    REQUIRE_FALSE(quick.hasCachedValue(t0));

    double first = quick.estimate(store, t0);
    REQUIRE(quick.hasCachedValue(t0 + 100ms));

    store.clear();
    REQUIRE(quick.estimate(store, t0 + 499ms) == first);
    // Expired: recomputed from the (now empty) store
    REQUIRE(quick.estimate(store, t0 + 500ms) == 0.0);

    for (auto const& s : exponentialRun(100, 0.2, 0.01)) {
        store.push(s);
    }
    quick.invalidate();
    REQUIRE_FALSE(quick.hasCachedValue(t0 + 501ms));
    REQUIRE(quick.estimate(store, t0 + 501ms) == Approx(first));
}

TEST_CASE("QuickLyapunov requires a usable window", "[chaos][quick]") {
    REQUIRE_THROWS_AS(QuickLyapunov(2, 1000ms), std::invalid_argument);
    REQUIRE(QuickLyapunov(3, 1000ms).window() == 3);
}
