#pragma once

#include "config.h"
#include "thomas_system.h"

#include <nlohmann/json.hpp>
#include <vector>

namespace field {

enum class StreamlineEnd { MaxPoints, LeftWindow };

struct Streamline {
    std::vector<Vec3> points;
    std::vector<Vec3> velocities;
    std::vector<double> step_sizes; // step_sizes[i] took points[i] to points[i+1]
    StreamlineEnd end = StreamlineEnd::MaxPoints;

    size_t size() const { return points.size(); }
    nlohmann::json toJSON() const;
};

struct AdaptiveStep {
    Vec3 state{};
    double used_step = 0.0; // Step size of the accepted result
    double next_step = 0.0; // Suggested size for the following step
    double error = 0.0;     // Max coordinate difference, one step vs two half steps
};

// RK4 with step doubling. The two-half-step result is accepted when the
// discrepancy is within tolerance or the step is already at min_step;
// otherwise the step halves (floored at min_step) and is retried.
AdaptiveStep adaptiveStep(ThomasSystem const& system, Vec3 const& state, double step,
                          StreamlineParams const& params);

// Integrates from `seed` until max_points are recorded or the path leaves [-R, R]^3
Streamline traceStreamline(ThomasSystem const& system, Vec3 const& seed, double half_range,
                           StreamlineParams const& params);

// `count` lines from seeds drawn uniformly in [-R/2, R/2]^3; lines with
// min_points or fewer points are dropped
std::vector<Streamline> generateStreamlines(ThomasSystem const& system, double half_range,
                                            StreamlineParams const& params);

} // namespace field
