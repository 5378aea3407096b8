// ==============================================================================
// Unit Tests: Spatial hash neighbor queries
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "field/spatial_hash.h"

#include <algorithm>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

using namespace field;

namespace {

std::vector<Vec3> randomPoints(int n, double extent, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> coord(-extent, extent);
    std::vector<Vec3> pts;
    for (int i = 0; i < n; ++i) {
        pts.push_back({coord(rng), coord(rng), coord(rng)});
    }
    return pts;
}

std::vector<uint32_t> bruteForce(std::vector<Vec3> const& pts, Vec3 const& p, double radius) {
    std::vector<uint32_t> result;
    for (uint32_t i = 0; i < pts.size(); ++i) {
        if (distance(pts[i], p) <= radius) {
            result.push_back(i);
        }
    }
    return result;
}

} // namespace

TEST_CASE("SpatialHash rejects invalid geometry", "[field][hash]") {
    REQUIRE_THROWS_AS(SpatialHash(0.0, 8, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(SpatialHash(10.0, 0, 1), std::invalid_argument);
    REQUIRE_NOTHROW(SpatialHash(10.0, 8, 0));
}

TEST_CASE("SpatialHash radius queries match brute force", "[field][hash]") {
    auto pts = randomPoints(500, 10.0, 3);
    SpatialHash hash(10.0, 8, 1);
    hash.rebuild(pts);
    REQUIRE(hash.pointCount() == 500);
    REQUIRE(hash.bucketSize() == 2.5);

    auto queries = randomPoints(20, 10.0, 11);
    for (double radius : {0.5, 2.0, 6.0}) {
        for (auto const& q : queries) {
            auto found = hash.within(q, radius);
            std::sort(found.begin(), found.end());
            REQUIRE(found == bruteForce(pts, q, radius));

            // Every true neighbor is among the candidates
            auto candidates = hash.candidates(q, radius);
            std::sort(candidates.begin(), candidates.end());
            for (uint32_t idx : found) {
                REQUIRE(std::binary_search(candidates.begin(), candidates.end(), idx));
            }
        }
    }
}

TEST_CASE("SpatialHash handles points outside the cube", "[field][hash]") {
    std::vector<Vec3> pts = {{12.0, 0.0, 0.0}, {12.5, 0.0, 0.0}, {-3.0, 0.0, 0.0}};
    SpatialHash hash(10.0, 4, 1);
    hash.rebuild(pts);

    auto found = hash.within({12.2, 0.0, 0.0}, 1.0);
    std::sort(found.begin(), found.end());
    REQUIRE(found == std::vector<uint32_t>{0, 1});
}

TEST_CASE("SpatialHash skips non-finite points", "[field][hash]") {
    double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<Vec3> pts = {{0.0, 0.0, 0.0}, {nan, 0.0, 0.0}, {0.1, 0.0, 0.0}};
    SpatialHash hash(10.0, 8, 1);
    hash.rebuild(pts);

    auto found = hash.within({0.0, 0.0, 0.0}, 1.0);
    std::sort(found.begin(), found.end());
    REQUIRE(found == std::vector<uint32_t>{0, 2});
    REQUIRE(hash.bucketCount() == 1);
}

TEST_CASE("SpatialHash empty after rebuild with no points", "[field][hash]") {
    SpatialHash hash(10.0, 8, 1);
    hash.rebuild(randomPoints(10, 5.0, 1));
    hash.rebuild(std::vector<Vec3>{});
    REQUIRE(hash.candidates({0.0, 0.0, 0.0}, 100.0).empty());
    REQUIRE(hash.bucketCount() == 0);
}
