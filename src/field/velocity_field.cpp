#include "field/velocity_field.h"
#include "enum_utils.h"

#include <cmath>

namespace field {

VelocityGrid analyticVelocity(GridGeometry const& grid, ThomasSystem const& system) {
    VelocityGrid result;
    size_t n = grid.cellCount();
    result.velocity.resize(n);
    result.magnitude.resize(n);
    result.coverage.assign(n, 1);
    for (size_t idx = 0; idx < n; ++idx) {
        result.velocity[idx] = system.velocity(grid.cellCenter(idx));
        result.magnitude[idx] = norm(result.velocity[idx]);
    }
    return result;
}

VelocityGrid sampledVelocity(GridGeometry const& grid, std::span<TrajectorySample const> samples,
                             SpatialHash const& hash) {
    VelocityGrid result;
    size_t n = grid.cellCount();
    result.velocity.assign(n, Vec3{});
    result.magnitude.assign(n, 0.0);
    result.coverage.assign(n, 0);

    double search_radius = 2.0 * grid.cellSize();
    for (size_t idx = 0; idx < n; ++idx) {
        Vec3 center = grid.cellCenter(idx);
        Vec3 weighted{};
        double weight_sum = 0.0;
        int used = 0;
        for (uint32_t s : hash.within(center, search_radius)) {
            if (s >= samples.size()) {
                continue;
            }
            double d = distance(samples[s].position, center);
            double w = 1.0 / (1.0 + d);
            weighted += w * samples[s].velocity;
            weight_sum += w;
            ++used;
        }
        if (weight_sum > 0.0) {
            result.velocity[idx] = (1.0 / weight_sum) * weighted;
            result.magnitude[idx] = norm(result.velocity[idx]);
            result.coverage[idx] = used;
        }
    }
    return result;
}

TensorGrid gradientTensors(GridGeometry const& grid, ThomasSystem const& system) {
    TensorGrid result(grid.cellCount());
    for (size_t idx = 0; idx < result.size(); ++idx) {
        result[idx] = system.jacobian(grid.cellCenter(idx));
    }
    return result;
}

std::vector<EigenDecomposition> eigenGrid(TensorGrid const& gradients) {
    std::vector<EigenDecomposition> result;
    result.reserve(gradients.size());
    for (Mat3 const& m : gradients) {
        result.push_back(decompose(m));
    }
    return result;
}

ScalarGrid divergenceGrid(GridGeometry const& grid, VectorGrid const& velocity) {
    ScalarGrid result(grid.cellCount(), 0.0);
    int n = grid.resolution;
    double inv_2h = 1.0 / (2.0 * grid.cellSize());
    for (int k = 1; k < n - 1; ++k) {
        for (int j = 1; j < n - 1; ++j) {
            for (int i = 1; i < n - 1; ++i) {
                double dvx = velocity[grid.index(i + 1, j, k)][0] - velocity[grid.index(i - 1, j, k)][0];
                double dvy = velocity[grid.index(i, j + 1, k)][1] - velocity[grid.index(i, j - 1, k)][1];
                double dvz = velocity[grid.index(i, j, k + 1)][2] - velocity[grid.index(i, j, k - 1)][2];
                result[grid.index(i, j, k)] = (dvx + dvy + dvz) * inv_2h;
            }
        }
    }
    return result;
}

VectorGrid vorticityGrid(GridGeometry const& grid, VectorGrid const& velocity) {
    VectorGrid result(grid.cellCount(), Vec3{});
    int n = grid.resolution;
    double inv_2h = 1.0 / (2.0 * grid.cellSize());
    for (int k = 1; k < n - 1; ++k) {
        for (int j = 1; j < n - 1; ++j) {
            for (int i = 1; i < n - 1; ++i) {
                Vec3 const& xp = velocity[grid.index(i + 1, j, k)];
                Vec3 const& xm = velocity[grid.index(i - 1, j, k)];
                Vec3 const& yp = velocity[grid.index(i, j + 1, k)];
                Vec3 const& ym = velocity[grid.index(i, j - 1, k)];
                Vec3 const& zp = velocity[grid.index(i, j, k + 1)];
                Vec3 const& zm = velocity[grid.index(i, j, k - 1)];

                // curl = (dVz/dy - dVy/dz, dVx/dz - dVz/dx, dVy/dx - dVx/dy)
                result[grid.index(i, j, k)] = {((yp[2] - ym[2]) - (zp[1] - zm[1])) * inv_2h,
                                               ((zp[0] - zm[0]) - (xp[2] - xm[2])) * inv_2h,
                                               ((xp[1] - xm[1]) - (yp[0] - ym[0])) * inv_2h};
            }
        }
    }
    return result;
}

std::vector<CriticalPoint> findCriticalPoints(GridGeometry const& grid,
                                              VelocityGrid const& velocity,
                                              std::vector<EigenDecomposition> const& eigen,
                                              double threshold) {
    std::vector<CriticalPoint> points;
    int n = grid.resolution;
    for (int k = 1; k < n - 1; ++k) {
        for (int j = 1; j < n - 1; ++j) {
            for (int i = 1; i < n - 1; ++i) {
                size_t idx = grid.index(i, j, k);
                if (velocity.coverage[idx] == 0 || velocity.magnitude[idx] >= threshold) {
                    continue;
                }
                CriticalPoint cp;
                cp.position = grid.cellCenter(i, j, k);
                cp.cell = idx;
                cp.speed = velocity.magnitude[idx];
                cp.eigenvalues = eigen[idx].values;
                cp.eigenvectors = eigen[idx].vectors;
                cp.type = classify(cp.eigenvalues);
                points.push_back(cp);
            }
        }
    }
    return points;
}

TopologySummary summarizeTopology(std::vector<CriticalPoint> const& points) {
    TopologySummary summary;
    for (auto const& cp : points) {
        switch (cp.type) {
        case CriticalPointType::Saddle:
            ++summary.saddles;
            break;
        case CriticalPointType::StableNode:
            ++summary.stable_nodes;
            break;
        case CriticalPointType::UnstableNode:
            ++summary.unstable_nodes;
            break;
        case CriticalPointType::Focus:
            ++summary.foci;
            break;
        }

        int negative = 0;
        for (double v : cp.eigenvalues) {
            if (v < 0.0) {
                ++negative;
            }
        }
        summary.euler_characteristic += (negative % 2 == 0) ? 1 : -1;
    }
    return summary;
}

nlohmann::json CriticalPoint::toJSON() const {
    nlohmann::json j;
    j["position"] = position;
    j["cell"] = cell;
    j["speed"] = speed;
    j["eigenvalues"] = eigenvalues;
    j["eigenvectors"] = eigenvectors;
    j["type"] = enum_utils::toString(type);
    return j;
}

nlohmann::json TopologySummary::toJSON() const {
    return {{"saddles", saddles},
            {"stable_nodes", stable_nodes},
            {"unstable_nodes", unstable_nodes},
            {"foci", foci},
            {"total", total()},
            {"euler_characteristic", euler_characteristic}};
}

} // namespace field
