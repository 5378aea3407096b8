#include "field/streamline.h"
#include "enum_utils.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace field {

AdaptiveStep adaptiveStep(ThomasSystem const& system, Vec3 const& state, double step,
                          StreamlineParams const& params) {
    double h = std::clamp(step, params.min_step, params.max_step);

    while (true) {
        Vec3 full = system.step(state, h);
        Vec3 half = system.step(system.step(state, h / 2), h / 2);
        double error = std::max({std::abs(full[0] - half[0]), std::abs(full[1] - half[1]),
                                 std::abs(full[2] - half[2])});

        if (error < params.tolerance || h <= params.min_step) {
            return {half, h, std::min(h * 1.2, params.max_step), error};
        }
        h = std::max(h * 0.5, params.min_step);
    }
}

Streamline traceStreamline(ThomasSystem const& system, Vec3 const& seed, double half_range,
                           StreamlineParams const& params) {
    Streamline line;
    line.points.push_back(seed);
    line.velocities.push_back(system.velocity(seed));

    double h = params.max_step;
    while (line.points.size() < static_cast<size_t>(params.max_points)) {
        AdaptiveStep next = adaptiveStep(system, line.points.back(), h, params);
        Vec3 const& s = next.state;
        if (!isFinite(s) || std::abs(s[0]) > half_range || std::abs(s[1]) > half_range ||
            std::abs(s[2]) > half_range) {
            line.end = StreamlineEnd::LeftWindow;
            return line;
        }
        line.points.push_back(s);
        line.velocities.push_back(system.velocity(s));
        line.step_sizes.push_back(next.used_step);
        h = next.next_step;
    }
    line.end = StreamlineEnd::MaxPoints;
    return line;
}

std::vector<Streamline> generateStreamlines(ThomasSystem const& system, double half_range,
                                            StreamlineParams const& params) {
    std::mt19937 rng(params.seed);
    std::uniform_real_distribution<double> offset(-0.5, 0.5);

    std::vector<Streamline> lines;
    for (int i = 0; i < params.count; ++i) {
        Vec3 seed = {offset(rng) * half_range, offset(rng) * half_range,
                     offset(rng) * half_range};
        Streamline line = traceStreamline(system, seed, half_range, params);
        if (line.size() > static_cast<size_t>(params.min_points)) {
            lines.push_back(std::move(line));
        }
    }
    return lines;
}

nlohmann::json Streamline::toJSON() const {
    nlohmann::json j;
    j["points"] = points;
    j["velocities"] = velocities;
    j["step_sizes"] = step_sizes;
    j["end"] = enum_utils::toString(end);
    return j;
}

} // namespace field
