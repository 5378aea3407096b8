// ==============================================================================
// Unit Tests: Monte Carlo / RBF density approximation
// ==============================================================================

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "field/stochastic_field.h"

#include <chrono>
#include <cmath>
#include <stdexcept>

using namespace field;
using Catch::Approx;

namespace {

AccelerationParams smallParams() {
    AccelerationParams params;
    params.monte_carlo_samples = 400;
    params.fit_samples = 150;
    return params;
}

} // namespace

TEST_CASE("Density proxy formula", "[field][stochastic]") {
    REQUIRE(densityProxy({0.0, 0.0, 0.0}, 0.19) == Approx(std::exp(0.19)));

    Vec3 p = {1.0, 2.0, -1.5};
    double expected = std::exp(-(1.0 + 4.0 + 2.25) / 10.0) *
                      std::exp(std::sin(2.0) + std::sin(-1.5) + 0.19);
    REQUIRE(densityProxy(p, 0.19) == Approx(expected));
}

TEST_CASE("Fibonacci sphere points lie on the sphere", "[field][stochastic]") {
    auto pts = fibonacciSphere(12, 8.0);
    REQUIRE(pts.size() == 12);
    for (auto const& p : pts) {
        REQUIRE(norm(p) == Approx(8.0));
    }

    auto single = fibonacciSphere(1, 3.0);
    REQUIRE(single.size() == 1);
    REQUIRE(single[0][0] == Approx(3.0));
    REQUIRE(single[0][1] == Approx(0.0).margin(1e-12));
    REQUIRE(single[0][2] == Approx(0.0).margin(1e-12));
}

TEST_CASE("Importance peaks on the torus", "[field][stochastic]") {
    StochasticDensityField field(10.0, smallParams());

    REQUIRE(field.importance({20.0, 0.0, 0.0}) == Approx(0.1));
    double on_torus = field.importance({5.0, 0.0, 0.0});
    double off_torus = field.importance({0.0, 0.0, 8.0});
    REQUIRE(on_torus > off_torus);
    REQUIRE(on_torus <= 1.0);
}

TEST_CASE("Stochastic field fit", "[field][stochastic]") {
    auto params = smallParams();
    StochasticDensityField field(10.0, params);
    REQUIRE_FALSE(field.fitted());
    REQUIRE(field.centers().size() == 12);

    field.fit(ThomasSystem(0.19));
    REQUIRE(field.fitted());
    REQUIRE(field.samples().size() == 400);
    for (auto const& s : field.samples()) {
        REQUIRE(std::abs(s[0]) <= 10.0);
        REQUIRE(std::abs(s[1]) <= 10.0);
        REQUIRE(std::abs(s[2]) <= 10.0);
    }
    for (double w : field.weights()) {
        REQUIRE(w > 0.0);
    }
    REQUIRE(field.evaluate({0.0, 0.0, 0.0}) > 0.0);

    // Same seed, same fit
    StochasticDensityField again(10.0, params);
    again.fit(ThomasSystem(0.19));
    REQUIRE(again.samples() == field.samples());
    REQUIRE(again.weights() == field.weights());
}

TEST_CASE("Stochastic field rejects invalid geometry", "[field][stochastic]") {
    auto params = smallParams();
    REQUIRE_THROWS_AS(StochasticDensityField(0.0, params), std::invalid_argument);
    params.cache_block = 0;
    REQUIRE_THROWS_AS(StochasticDensityField(10.0, params), std::invalid_argument);
}

TEST_CASE("Grid fills reuse cached coarse cells", "[field][stochastic][cache]") {
    using Clock = StochasticDensityField::Clock;
    StochasticDensityField field(10.0, smallParams());
    field.fit(ThomasSystem(0.19));

    GridGeometry grid{8, 10.0};
    Clock::time_point t0{};

    auto first = field.fillGrid(grid, t0);
    REQUIRE(first.size() == 512);
    // 2^3 coarse blocks of 4^3 cells
    REQUIRE(field.cacheSize() == 8);
    REQUIRE(field.cacheHits() == 504);
    REQUIRE(first[grid.index(0, 0, 0)] == first[grid.index(3, 3, 3)]);
    REQUIRE(first[grid.index(0, 0, 0)] == Approx(field.evaluate(grid.cellCenter(0, 0, 0))));

    SECTION("repeat fill within expiry is all hits") {
        auto second = field.fillGrid(grid, t0 + std::chrono::seconds(1));
        REQUIRE(second == first);
        REQUIRE(field.cacheHits() == 504 + 512);
    }

    SECTION("expired blocks are recomputed") {
        field.fillGrid(grid, t0 + std::chrono::seconds(6));
        REQUIRE(field.cacheSize() == 8);
        REQUIRE(field.cacheHits() == 504 + 504);
    }

    SECTION("clearCache forces recomputation") {
        field.clearCache();
        REQUIRE(field.cacheSize() == 0);
        field.fillGrid(grid, t0);
        REQUIRE(field.cacheHits() == 504 + 504);
    }
}
