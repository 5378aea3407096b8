// ==============================================================================
// Unit Tests: Enum string conversion
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "config.h"
#include "enum_utils.h"
#include "field/eigen_solver.h"

TEST_CASE("Enum names are snake_case", "[core][enum]") {
    REQUIRE(enum_utils::toString(field::CriticalPointType::StableNode) == "stable_node");
    REQUIRE(enum_utils::toString(field::CriticalPointType::Saddle) == "saddle");
    REQUIRE(enum_utils::toString(DensityMethod::Auto) == "auto");
}

TEST_CASE("Enum parsing ignores case and underscores", "[core][enum]") {
    using field::CriticalPointType;
    REQUIRE(enum_utils::fromString<CriticalPointType>("unstable_node") ==
            CriticalPointType::UnstableNode);
    REQUIRE(enum_utils::fromString<CriticalPointType>("UnstableNode") ==
            CriticalPointType::UnstableNode);
    REQUIRE(enum_utils::fromString<VelocityMode>("SAMPLED") == VelocityMode::Sampled);
    REQUIRE_FALSE(enum_utils::fromString<VelocityMode>("interpolated").has_value());
    REQUIRE_FALSE(enum_utils::fromString<VelocityMode>("").has_value());
}

TEST_CASE("Enum choices list every value", "[core][enum]") {
    REQUIRE(enum_utils::choices<VelocityMode>() == "analytic | sampled");
    REQUIRE(enum_utils::choices<DensityMethod>() == "exact | stochastic | auto");
}
