#pragma once

#include "config.h"
#include "field/eigen_solver.h"
#include "field/grid.h"
#include "field/streamline.h"
#include "field/velocity_field.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

namespace field {

struct FieldStatistics {
    double entropy = 0.0; // Bits, over the smooth density grid
    double correlation_dimension = 0.0;
    double information_dimension = 0.0;
    double max_density = 0.0;
    double mean_local_lyapunov = 0.0;
    size_t sample_count = 0;
    Vec3 mean{};
    Mat3 covariance{};

    nlohmann::json toJSON() const;
};

struct PassTiming {
    double density_ms = 0.0;
    double statistics_ms = 0.0;
    double velocity_ms = 0.0;
    double topology_ms = 0.0;
    double streamline_ms = 0.0;
    double local_lyapunov_ms = 0.0;
    double total_ms = 0.0;

    nlohmann::json toJSON() const;
};

// Everything one analysis pass produces. Built in full and then published,
// so a snapshot never mixes grids from different passes.
struct FieldSnapshot {
    GridGeometry geometry;
    uint64_t epoch = 0; // Parameter epoch the pass ran under
    double b = 0.0;
    DensityMethod density_method = DensityMethod::Exact; // Path actually used
    VelocityMode velocity_mode = VelocityMode::Analytic;

    ScalarGrid histogram_density;
    ScalarGrid kde_density;
    VelocityGrid velocity;
    TensorGrid gradient;
    std::vector<EigenDecomposition> eigen;
    ScalarGrid divergence;
    VectorGrid vorticity;
    ScalarGrid local_lyapunov;

    std::vector<CriticalPoint> critical_points;
    TopologySummary topology;
    std::vector<Streamline> streamlines;
    FieldStatistics statistics;
    PassTiming timing;

    // Grids are emitted as flat arrays (vector grids interleave x,y,z per cell)
    nlohmann::json toJSON(bool include_grids = true) const;
};

} // namespace field
