// ==============================================================================
// Unit Tests: Velocity grids, derivatives and critical points
// ==============================================================================

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "field/velocity_field.h"

#include <cmath>
#include <string>
#include <vector>

using namespace field;
using Catch::Approx;

namespace {

// Odd resolution puts the center cell exactly on the origin (unit cells)
GridGeometry const ORIGIN_GRID{9, 4.5};

} // namespace

TEST_CASE("Analytic velocity grid", "[field][velocity]") {
    ThomasSystem system(0.19);
    auto v = analyticVelocity(ORIGIN_GRID, system);

    REQUIRE(v.velocity.size() == ORIGIN_GRID.cellCount());
    size_t idx = ORIGIN_GRID.index(2, 6, 7);
    Vec3 expected = system.velocity(ORIGIN_GRID.cellCenter(2, 6, 7));
    REQUIRE(v.velocity[idx] == expected);
    REQUIRE(v.magnitude[idx] == Approx(norm(expected)));
    REQUIRE(v.coverage[idx] == 1);
    REQUIRE(v.magnitude[ORIGIN_GRID.index(4, 4, 4)] == 0.0);
}

TEST_CASE("Sampled velocity averages nearby samples", "[field][velocity]") {
    GridGeometry grid{8, 4.0};
    Vec3 center = grid.cellCenter(3, 3, 3);

    std::vector<TrajectorySample> samples = {
        {center + Vec3{0.1, 0.0, 0.0}, {1.0, 2.0, 3.0}, 0.0},
        {center + Vec3{0.0, -0.2, 0.0}, {1.0, 2.0, 3.0}, 0.01},
    };
    std::vector<Vec3> positions = {samples[0].position, samples[1].position};
    SpatialHash hash(grid.half_range, 4, 1);
    hash.rebuild(positions);

    auto v = sampledVelocity(grid, samples, hash);
    size_t idx = grid.index(3, 3, 3);
    REQUIRE(v.coverage[idx] == 2);
    REQUIRE(v.velocity[idx][0] == Approx(1.0));
    REQUIRE(v.velocity[idx][2] == Approx(3.0));
    REQUIRE(v.magnitude[idx] == Approx(std::sqrt(14.0)));

    // Far corner has no samples within two cell widths
    size_t far = grid.index(7, 7, 7);
    REQUIRE(v.coverage[far] == 0);
    REQUIRE(v.magnitude[far] == 0.0);
}

TEST_CASE("Sampled velocity ignores hash neighbors beyond two cell widths", "[field][velocity]") {
    GridGeometry grid{8, 4.0};
    Vec3 center = grid.cellCenter(3, 3, 3);

    // The third sample shares a neighbouring bucket but sits 2.2 cells away
    std::vector<TrajectorySample> samples = {
        {center + Vec3{0.1, 0.0, 0.0}, {1.0, 0.0, 0.0}, 0.0},
        {center + Vec3{0.0, 0.3, 0.0}, {1.0, 0.0, 0.0}, 0.01},
        {center + Vec3{2.2, 0.0, 0.0}, {0.0, 0.0, 9.0}, 0.02},
    };
    std::vector<Vec3> positions = {samples[0].position, samples[1].position,
                                   samples[2].position};
    SpatialHash hash(grid.half_range, 4, 1);
    hash.rebuild(positions);
    REQUIRE(hash.candidates(center, 2.0 * grid.cellSize()).size() == 3);

    auto v = sampledVelocity(grid, samples, hash);
    size_t idx = grid.index(3, 3, 3);
    REQUIRE(v.coverage[idx] == 2);
    REQUIRE(v.velocity[idx][0] == Approx(1.0));
    REQUIRE(v.velocity[idx][2] == 0.0);
}

TEST_CASE("Divergence of the analytic field is -3b", "[field][velocity]") {
    ThomasSystem system(0.19);
    auto v = analyticVelocity(ORIGIN_GRID, system);
    auto div = divergenceGrid(ORIGIN_GRID, v.velocity);

    REQUIRE(div[ORIGIN_GRID.index(4, 4, 4)] == Approx(-0.57).margin(1e-12));
    REQUIRE(div[ORIGIN_GRID.index(1, 7, 3)] == Approx(-0.57).margin(1e-12));
    // Boundary cells are left at zero
    REQUIRE(div[ORIGIN_GRID.index(0, 4, 4)] == 0.0);
    REQUIRE(div[ORIGIN_GRID.index(4, 8, 4)] == 0.0);
}

TEST_CASE("Vorticity matches the discrete curl", "[field][velocity]") {
    ThomasSystem system(0.19);
    auto v = analyticVelocity(ORIGIN_GRID, system);
    auto curl = vorticityGrid(ORIGIN_GRID, v.velocity);

    double h = ORIGIN_GRID.cellSize();
    double damping = std::sin(h) / h; // central difference of sin
    Vec3 c = ORIGIN_GRID.cellCenter(3, 5, 2);
    Vec3 w = curl[ORIGIN_GRID.index(3, 5, 2)];

    REQUIRE(w[0] == Approx(-std::cos(c[2]) * damping).margin(1e-12));
    REQUIRE(w[1] == Approx(-std::cos(c[0]) * damping).margin(1e-12));
    REQUIRE(w[2] == Approx(-std::cos(c[1]) * damping).margin(1e-12));
    REQUIRE(curl[ORIGIN_GRID.index(0, 0, 0)] == Vec3{0.0, 0.0, 0.0});
}

TEST_CASE("Critical point at the origin is a saddle", "[field][velocity][critical]") {
    ThomasSystem system(0.19);
    auto v = analyticVelocity(ORIGIN_GRID, system);
    auto eigen = eigenGrid(gradientTensors(ORIGIN_GRID, system));
    auto points = findCriticalPoints(ORIGIN_GRID, v, eigen, 0.01);

    REQUIRE(points.size() == 1);
    auto const& cp = points.front();
    REQUIRE(cp.cell == ORIGIN_GRID.index(4, 4, 4));
    REQUIRE(norm(cp.position) == 0.0);
    REQUIRE(cp.type == CriticalPointType::Saddle);
    REQUIRE(cp.eigenvalues[0] == Approx(0.81));
    REQUIRE(cp.eigenvalues[2] == Approx(-0.69));

    auto topology = summarizeTopology(points);
    REQUIRE(topology.saddles == 1);
    REQUIRE(topology.total() == 1);
    // Two negative eigenvalues
    REQUIRE(topology.euler_characteristic == 1);

    auto j = cp.toJSON();
    REQUIRE(j["type"].get<std::string>() == "saddle");
    REQUIRE(j["eigenvectors"].size() == 3);
}

TEST_CASE("Critical points need coverage and an interior cell", "[field][velocity][critical]") {
    ThomasSystem system(0.19);
    auto eigen = eigenGrid(gradientTensors(ORIGIN_GRID, system));

    SECTION("uncovered cells are skipped") {
        auto v = analyticVelocity(ORIGIN_GRID, system);
        v.coverage.assign(v.coverage.size(), 0);
        REQUIRE(findCriticalPoints(ORIGIN_GRID, v, eigen, 0.01).empty());
    }

    SECTION("boundary cells are never reported") {
        VelocityGrid still;
        still.velocity.assign(ORIGIN_GRID.cellCount(), Vec3{});
        still.magnitude.assign(ORIGIN_GRID.cellCount(), 0.0);
        still.coverage.assign(ORIGIN_GRID.cellCount(), 1);
        auto points = findCriticalPoints(ORIGIN_GRID, still, eigen, 0.01);
        REQUIRE(points.size() == 7 * 7 * 7);
        for (auto const& cp : points) {
            auto [i, j, k] = ORIGIN_GRID.coords(cp.cell);
            REQUIRE(ORIGIN_GRID.isInterior(i, j, k));
        }
    }
}

TEST_CASE("Topology summary counts each type", "[field][velocity][critical]") {
    std::vector<CriticalPoint> points(4);
    points[0].eigenvalues = {0.5, -0.1, -0.2};
    points[0].type = classify(points[0].eigenvalues);
    points[1].eigenvalues = {-0.5, -0.1, -0.2};
    points[1].type = classify(points[1].eigenvalues);
    points[2].eigenvalues = {0.5, 0.1, 0.2};
    points[2].type = classify(points[2].eigenvalues);
    points[3].eigenvalues = {0.5, 0.1, -0.2};
    points[3].type = classify(points[3].eigenvalues);

    auto t = summarizeTopology(points);
    REQUIRE(t.saddles == 2);
    REQUIRE(t.stable_nodes == 1);
    REQUIRE(t.unstable_nodes == 1);
    REQUIRE(t.foci == 0);
    // +1 (two negative), -1 (three), +1 (none), -1 (one)
    REQUIRE(t.euler_characteristic == 0);
    REQUIRE(t.toJSON()["total"] == 4);
}
