// ==============================================================================
// Unit Tests: AttractorEngine
// ==============================================================================
// Stepping, parameter epochs, cache invalidation and field snapshots
// ==============================================================================

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "attractor_engine.h"

#include <cmath>
#include <limits>
#include <stdexcept>

using Catch::Approx;

namespace {

// Small field grid so a full analysis pass stays fast
Config smallConfig() {
    Config config;
    config.field.resolution = 8;
    config.field.local_lyapunov_iterations = 20;
    config.streamlines.count = 3;
    config.streamlines.max_points = 40;
    config.trajectory.analysis_capacity = 500;
    config.lyapunov.metric_steps = 200;
    config.lyapunov.metric_skip_transient = 20;
    return config;
}

} // namespace

TEST_CASE("AttractorEngine rejects invalid configuration", "[core][engine]") {
    Config config;

    SECTION("non-positive b") {
        config.model.b = 0.0;
        REQUIRE_THROWS_AS(AttractorEngine(config), std::invalid_argument);
    }
    SECTION("non-positive dt") {
        config.model.dt = -0.01;
        REQUIRE_THROWS_AS(AttractorEngine(config), std::invalid_argument);
    }
    SECTION("non-finite seed") {
        config.model.seed = {0.0, std::numeric_limits<double>::quiet_NaN(), 0.0};
        REQUIRE_THROWS_AS(AttractorEngine(config), std::invalid_argument);
    }
}

TEST_CASE("AttractorEngine steps deterministically", "[core][engine]") {
    Config config = smallConfig();
    AttractorEngine a(config);
    AttractorEngine b(config);

    auto pa = a.step(250);
    auto pb = b.step(250);

    REQUIRE(pa.size() == 250);
    REQUIRE(pa.back() == pb.back());
    REQUIRE(a.state() == pa.back());

    auto params = a.getParameters();
    REQUIRE(params.steps == 250);
    REQUIRE(params.time == Approx(2.5));
    REQUIRE(params.epoch == 0);
    REQUIRE(a.recentTrajectory().size() == 250);

    REQUIRE_THROWS_AS(a.step(-1), std::invalid_argument);
    REQUIRE(a.step(0).empty());
}

TEST_CASE("AttractorEngine transient steps run before the first step", "[core][engine]") {
    Config config = smallConfig();
    config.model.transient_steps = 100;
    AttractorEngine engine(config);

    ThomasSystem system(config.model.b);
    Vec3 expected = config.model.seed;
    for (int i = 0; i < 100; ++i) {
        expected = system.step(expected, config.model.dt);
    }
    REQUIRE(engine.state() == expected);
    REQUIRE(engine.getParameters().steps == 0);
}

TEST_CASE("AttractorEngine parameter changes start a new epoch", "[core][engine]") {
    AttractorEngine engine(smallConfig());
    engine.step(300);
    engine.computeLyapunovSpectrum(500, 50);
    REQUIRE(engine.lastSpectrum().has_value());

    SECTION("setB") {
        engine.setB(0.21);
        REQUIRE(engine.getParameters().epoch == 1);
        REQUIRE(engine.getParameters().b == Approx(0.21));
        REQUIRE(engine.system().b() == Approx(0.21));
        REQUIRE_FALSE(engine.lastSpectrum().has_value());
    }

    SECTION("setDt") {
        engine.setDt(0.005);
        REQUIRE(engine.getParameters().epoch == 1);
        REQUIRE(engine.getParameters().dt == Approx(0.005));
        REQUIRE_FALSE(engine.lastSpectrum().has_value());
    }

    SECTION("invalid values leave the engine unchanged") {
        REQUIRE_THROWS_AS(engine.setB(-0.1), std::invalid_argument);
        REQUIRE_THROWS_AS(engine.setDt(0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(engine.setB(std::numeric_limits<double>::infinity()),
                          std::invalid_argument);
        REQUIRE(engine.getParameters().epoch == 0);
        REQUIRE(engine.getParameters().b == Approx(0.19));
        REQUIRE(engine.lastSpectrum().has_value());
    }
}

TEST_CASE("AttractorEngine reset returns to the seed", "[core][engine]") {
    AttractorEngine engine(smallConfig());
    engine.step(100);

    engine.reset();
    REQUIRE(engine.state() == Vec3{0.1, 0.0, 0.0});
    REQUIRE(engine.getParameters().steps == 0);
    REQUIRE(engine.getParameters().time == 0.0);
    REQUIRE(engine.recentTrajectory().empty());
    REQUIRE(engine.getParameters().epoch == 1);

    engine.reset(Vec3{1.0, 1.0, 1.0});
    REQUIRE(engine.state() == Vec3{1.0, 1.0, 1.0});
    REQUIRE(engine.getParameters().seed == Vec3{1.0, 1.0, 1.0});
    REQUIRE(engine.getParameters().epoch == 2);

    REQUIRE_THROWS_AS(engine.reset(Vec3{std::numeric_limits<double>::infinity(), 0.0, 0.0}),
                      std::invalid_argument);
    REQUIRE(engine.getParameters().epoch == 2);
}

TEST_CASE("AttractorEngine spectrum does not advance the trajectory", "[core][engine]") {
    AttractorEngine engine(smallConfig());
    engine.step(200);
    Vec3 before = engine.state();

    auto spectrum = engine.computeLyapunovSpectrum(1000, 100);

    REQUIRE(engine.state() == before);
    REQUIRE(engine.getParameters().steps == 200);
    REQUIRE(spectrum.steps == 1000);
    REQUIRE(spectrum.exponents[0] >= spectrum.exponents[1]);
    REQUIRE(spectrum.exponents[1] >= spectrum.exponents[2]);
    REQUIRE(spectrum.sum == Approx(-0.57).margin(0.01));
}

TEST_CASE("AttractorEngine chaos metric reuses the current spectrum", "[core][engine]") {
    AttractorEngine engine(smallConfig());
    engine.step(200);

    SECTION("with a spectrum for this epoch") {
        auto spectrum = engine.computeLyapunovSpectrum(800, 100);
        auto metric = engine.computeChaosMetric();
        REQUIRE(metric.lambda1 == spectrum.lambda1());
        REQUIRE(metric.kaplan_yorke == spectrum.kaplan_yorke);
        REQUIRE(metric.b == Approx(0.19));
    }

    SECTION("without one, a short spectrum is computed") {
        auto metric = engine.computeChaosMetric();
        REQUIRE(engine.lastSpectrum().has_value());
        REQUIRE(engine.lastSpectrum()->steps == 200);
        REQUIRE(metric.lambda1 == engine.lastSpectrum()->lambda1());
    }
}

TEST_CASE("AttractorEngine quick estimate is cached until invalidated", "[core][engine]") {
    AttractorEngine engine(smallConfig());
    engine.step(400);
    auto now = chaos::QuickLyapunov::Clock::now();

    double first = engine.quickLyapunov(now);
    engine.step(50);
    // Within the cache interval the held value is returned
    REQUIRE(engine.quickLyapunov(now + std::chrono::milliseconds(10)) == first);
    REQUIRE(std::isfinite(first));

    engine.setB(0.2);
    engine.step(400);
    double after = engine.quickLyapunov(now + std::chrono::milliseconds(20));
    REQUIRE(std::isfinite(after));
    REQUIRE(after != first);
}

TEST_CASE("AttractorEngine field snapshots follow the epoch", "[core][engine]") {
    AttractorEngine engine(smallConfig());
    REQUIRE(engine.fieldSnapshot() == nullptr);

    auto batch = engine.step(600);
    auto snapshot = engine.analyzeSpatialField(batch);

    REQUIRE(snapshot != nullptr);
    REQUIRE(snapshot->epoch == 0);
    REQUIRE(snapshot->b == Approx(0.19));
    REQUIRE(snapshot->statistics.sample_count == 500);
    REQUIRE(snapshot->kde_density.size() == 8 * 8 * 8);
    REQUIRE_FALSE(engine.fieldStale());
    REQUIRE(engine.fieldSnapshot() == snapshot);

    engine.setB(0.2);
    REQUIRE(engine.fieldStale());
    // The old snapshot stays published until the next pass
    REQUIRE(engine.fieldSnapshot() == snapshot);

    auto next = engine.analyzeSpatialField(engine.step(100));
    REQUIRE(next != snapshot);
    REQUIRE(next->epoch == 1);
    REQUIRE(next->b == Approx(0.2));
    REQUIRE_FALSE(engine.fieldStale());
    // The earlier pass is untouched by the new one
    REQUIRE(snapshot->b == Approx(0.19));
}
