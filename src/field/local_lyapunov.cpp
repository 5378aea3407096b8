#include "field/local_lyapunov.h"

#include <cmath>

namespace field {

namespace {

constexpr double INITIAL_PERTURBATION = 1e-8;

bool escaped(Vec3 const& s, double bound) {
    return std::abs(s[0]) > bound || std::abs(s[1]) > bound || std::abs(s[2]) > bound;
}

} // namespace

double localLyapunov(ThomasSystem const& system, Vec3 const& start,
                     LocalLyapunovParams const& params) {
    Vec3 state = start;
    Vec3 tangent = {INITIAL_PERTURBATION, 0.0, 0.0};
    double log_sum = 0.0;
    int valid = 0;

    for (int it = 0; it < params.iterations; ++it) {
        Mat3 jac = system.jacobian(state);
        state = system.eulerStep(state, params.dt);
        tangent = tangent + params.dt * (jac * tangent);

        double len = norm(tangent);
        if (!std::isfinite(len) || len <= 0.0) {
            break;
        }
        log_sum += std::log(len / INITIAL_PERTURBATION);
        tangent = (INITIAL_PERTURBATION / len) * tangent;
        ++valid;

        if (escaped(state, params.escape_bound)) {
            break;
        }
    }

    if (valid == 0) {
        return 0.0;
    }
    return log_sum / (valid * params.dt);
}

ScalarGrid localLyapunovGrid(GridGeometry const& grid, ThomasSystem const& system,
                             LocalLyapunovParams const& params) {
    ScalarGrid result(grid.cellCount(), 0.0);
    for (size_t idx = 0; idx < result.size(); ++idx) {
        result[idx] = localLyapunov(system, grid.cellCenter(idx), params);
    }
    return result;
}

double finiteMean(ScalarGrid const& values) {
    double sum = 0.0;
    size_t count = 0;
    for (double v : values) {
        if (std::isfinite(v)) {
            sum += v;
            ++count;
        }
    }
    return count > 0 ? sum / count : 0.0;
}

} // namespace field
