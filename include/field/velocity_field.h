#pragma once

#include "field/eigen_solver.h"
#include "field/grid.h"
#include "field/spatial_hash.h"
#include "thomas_system.h"
#include "trajectory_store.h"

#include <nlohmann/json.hpp>
#include <span>
#include <vector>

namespace field {

// Velocity grid plus how many samples informed each cell
// (coverage is 1 everywhere for the analytic grid)
struct VelocityGrid {
    VectorGrid velocity;
    ScalarGrid magnitude;
    std::vector<int> coverage;
};

// Closed-form flow at every cell center
VelocityGrid analyticVelocity(GridGeometry const& grid, ThomasSystem const& system);

// Average of sample velocities within two cell widths of each center,
// weighted by 1 / (1 + distance). `hash` must index the sample positions.
VelocityGrid sampledVelocity(GridGeometry const& grid, std::span<TrajectorySample const> samples,
                             SpatialHash const& hash);

// Analytic Jacobian at every cell center
TensorGrid gradientTensors(GridGeometry const& grid, ThomasSystem const& system);

std::vector<EigenDecomposition> eigenGrid(TensorGrid const& gradients);

// Central differences over interior cells; boundary cells stay zero
ScalarGrid divergenceGrid(GridGeometry const& grid, VectorGrid const& velocity);
VectorGrid vorticityGrid(GridGeometry const& grid, VectorGrid const& velocity);

struct CriticalPoint {
    Vec3 position{};
    size_t cell = 0;
    double speed = 0.0;
    std::array<double, 3> eigenvalues{};
    std::array<Vec3, 3> eigenvectors{};
    CriticalPointType type = CriticalPointType::Focus;

    nlohmann::json toJSON() const;
};

// Interior cells whose speed is below `threshold` and that have coverage,
// classified by their eigenvalue signs
std::vector<CriticalPoint> findCriticalPoints(GridGeometry const& grid,
                                              VelocityGrid const& velocity,
                                              std::vector<EigenDecomposition> const& eigen,
                                              double threshold);

struct TopologySummary {
    int saddles = 0;
    int stable_nodes = 0;
    int unstable_nodes = 0;
    int foci = 0;
    int euler_characteristic = 0; // Sum of (-1)^(negative eigenvalue count)

    int total() const { return saddles + stable_nodes + unstable_nodes + foci; }
    nlohmann::json toJSON() const;
};

TopologySummary summarizeTopology(std::vector<CriticalPoint> const& points);

} // namespace field
