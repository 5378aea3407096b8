// ==============================================================================
// Unit Tests: Chaos metric and regime classification
// ==============================================================================

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "chaos/chaos_metric.h"

#include <cmath>
#include <string>

using namespace chaos;
using Catch::Approx;

TEST_CASE("Chaos metric combines unpredictability and complexity", "[chaos][metric]") {
    auto m = computeChaosMetric(0.1, 2.5, 0.19);

    double u = 1.0 - std::exp(-0.1 / 0.57);
    REQUIRE(m.unpredictability == Approx(u));
    REQUIRE(m.complexity == Approx(0.5));
    REQUIRE(m.ctm == Approx(std::sqrt(u * 0.5)));
    REQUIRE(m.b == Approx(0.19));
    REQUIRE(m.regime == ChaosRegime::ModerateChaos);
}

TEST_CASE("Chaos metric is zero without positive stretching", "[chaos][metric]") {
    auto m = computeChaosMetric(-0.05, 2.8, 0.19);
    REQUIRE(m.unpredictability == 0.0);
    REQUIRE(m.ctm == 0.0);
    REQUIRE(m.regime == ChaosRegime::Regular);

    auto zero = computeChaosMetric(0.0, 2.8, 0.19);
    REQUIRE(zero.ctm == 0.0);
}

TEST_CASE("Chaos metric complexity is clamped", "[chaos][metric]") {
    REQUIRE(computeChaosMetric(0.1, 1.5, 0.19).complexity == 0.0);
    REQUIRE(computeChaosMetric(0.1, 1.5, 0.19).ctm == 0.0);
    REQUIRE(computeChaosMetric(0.1, 3.0, 0.19).complexity == Approx(1.0));
    REQUIRE(computeChaosMetric(0.1, 3.7, 0.19).complexity == Approx(1.0));
}

TEST_CASE("Chaos metric stays in [0, 1]", "[chaos][metric]") {
    for (double l1 : {-0.2, 0.0, 0.01, 0.1, 0.5, 5.0}) {
        for (double d : {0.0, 2.0, 2.3, 2.9, 3.0}) {
            for (double b : {0.05, 0.19, 0.4}) {
                auto m = computeChaosMetric(l1, d, b);
                REQUIRE(m.ctm >= 0.0);
                REQUIRE(m.ctm <= 1.0);
            }
        }
    }
}

TEST_CASE("Regime bands", "[chaos][metric]") {
    REQUIRE(classifyRegime(-1.0) == ChaosRegime::Regular);
    REQUIRE(classifyRegime(0.0) == ChaosRegime::Regular);
    REQUIRE(classifyRegime(0.01) == ChaosRegime::WeakChaos);
    REQUIRE(classifyRegime(0.05) == ChaosRegime::ModerateChaos);
    REQUIRE(classifyRegime(0.149) == ChaosRegime::ModerateChaos);
    REQUIRE(classifyRegime(0.15) == ChaosRegime::StrongChaos);
    REQUIRE(classifyRegime(0.25) == ChaosRegime::Hyperchaos);
}

TEST_CASE("Chaos metric JSON uses snake_case regime names", "[chaos][metric]") {
    auto j = computeChaosMetric(0.2, 2.4, 0.19).toJSON();
    REQUIRE(j["regime"].get<std::string>() == "strong_chaos");
    REQUIRE(j.contains("ctm"));
    REQUIRE(j["kaplan_yorke"].get<double>() == Approx(2.4));
}
