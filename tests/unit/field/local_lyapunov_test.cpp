// ==============================================================================
// Unit Tests: Local Lyapunov probes
// ==============================================================================

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "field/local_lyapunov.h"

#include <cmath>
#include <limits>

using namespace field;
using Catch::Approx;

TEST_CASE("Local Lyapunov at the origin tends to the unstable eigenvalue", "[field][local]") {
    ThomasSystem system(0.19);
    LocalLyapunovParams params{0.01, 5000, 50.0};

    double rate = localLyapunov(system, {0.0, 0.0, 0.0}, params);
    // The Euler tangent map grows by 1 + dt*(1 - b) per step along (1,1,1)
    double asymptotic = std::log(1.0 + 0.01 * 0.81) / 0.01;
    REQUIRE(rate == Approx(asymptotic).margin(0.02));
    REQUIRE(rate < asymptotic);
}

TEST_CASE("Local Lyapunov with no iterations is zero", "[field][local]") {
    LocalLyapunovParams params{0.01, 0, 50.0};
    REQUIRE(localLyapunov(ThomasSystem(0.19), {1.0, 2.0, 3.0}, params) == 0.0);
}

TEST_CASE("Local Lyapunov stops once the probe escapes", "[field][local]") {
    ThomasSystem system(0.19);
    Vec3 outside = {80.0, 0.0, 0.0};

    double long_run = localLyapunov(system, outside, {0.01, 100, 50.0});
    double one_step = localLyapunov(system, outside, {0.01, 1, 50.0});
    REQUIRE(long_run == one_step);
    REQUIRE(std::isfinite(long_run));
}

TEST_CASE("Local Lyapunov grid and mean", "[field][local]") {
    GridGeometry grid{4, 4.0};
    auto values = localLyapunovGrid(grid, ThomasSystem(0.19), {0.01, 50, 50.0});
    REQUIRE(values.size() == 64);
    REQUIRE(values[5] == localLyapunov(ThomasSystem(0.19), grid.cellCenter(5), {0.01, 50, 50.0}));

    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();
    REQUIRE(finiteMean({1.0, nan, 3.0, inf}) == Approx(2.0));
    REQUIRE(finiteMean({}) == 0.0);
}
