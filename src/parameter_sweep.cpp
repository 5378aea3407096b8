#include "parameter_sweep.h"
#include "enum_utils.h"
#include "thomas_system.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <magic_enum/magic_enum.hpp>

namespace {

// Grid values are snapped to this resolution so zone and base points coincide
constexpr double GRID_QUANTUM = 1e-6;

double snap(double b) {
    return std::round(b / GRID_QUANTUM) * GRID_QUANTUM;
}

void appendRange(std::vector<double>& grid, double lo, double hi, double step) {
    if (!(step > 0.0) || hi < lo) {
        return;
    }
    long count = static_cast<long>(std::floor((hi - lo) / step + 1e-6));
    for (long i = 0; i <= count; ++i) {
        grid.push_back(snap(lo + i * step));
    }
}

} // namespace

nlohmann::json SweepPoint::toJSON() const {
    nlohmann::json j;
    j["b"] = b;
    j["spectrum"] = spectrum.toJSON();
    j["metric"] = metric.toJSON();
    j["elapsed_ms"] = elapsed_ms;
    return j;
}

nlohmann::json SweepSummary::toJSON() const {
    nlohmann::json j;
    j["points"] = points;
    j["max_ctm"] = max_ctm;
    j["max_ctm_b"] = max_ctm_b;
    j["max_lambda1"] = max_lambda1;
    j["max_lambda1_b"] = max_lambda1_b;
    j["chaos_boundary"] = chaos_boundary ? nlohmann::json(*chaos_boundary) : nlohmann::json();
    nlohmann::json counts;
    for (auto regime : magic_enum::enum_values<chaos::ChaosRegime>()) {
        counts[enum_utils::toString(regime)] = regime_counts[magic_enum::enum_integer(regime)];
    }
    j["regime_counts"] = counts;
    j["total_ms"] = total_ms;
    return j;
}

ParameterSweep::ParameterSweep(Config const& config)
    : params_(config.sweep), model_(config.model), lyapunov_(config.lyapunov) {}

std::vector<double> ParameterSweep::parameterGrid() const {
    std::vector<double> grid;
    appendRange(grid, params_.b_min, params_.b_max, params_.b_step);
    for (auto const& zone : params_.refinement) {
        appendRange(grid, std::max(zone.min, params_.b_min), std::min(zone.max, params_.b_max),
                    zone.step);
    }
    std::sort(grid.begin(), grid.end());
    grid.erase(std::unique(grid.begin(), grid.end(),
                           [](double a, double b) { return std::abs(a - b) < GRID_QUANTUM / 2; }),
               grid.end());
    // Non-positive b would be rejected by the estimator
    grid.erase(std::remove_if(grid.begin(), grid.end(), [](double b) { return b <= 0.0; }),
               grid.end());
    return grid;
}

SweepPoint ParameterSweep::computePoint(double b) const {
    auto start = std::chrono::steady_clock::now();

    ThomasSystem system(b);
    Vec3 state = model_.seed;
    for (int i = 0; i < model_.transient_steps; ++i) {
        state = system.step(state, model_.dt);
    }

    chaos::LyapunovEstimator estimator(system, model_.dt, lyapunov_);
    SweepPoint point;
    point.b = b;
    point.spectrum = estimator.run(state, params_.steps, params_.skip_transient);
    point.metric = chaos::computeChaosMetric(point.spectrum.lambda1(),
                                             point.spectrum.kaplan_yorke, b);
    point.elapsed_ms = std::chrono::duration<double, std::milli>(
                           std::chrono::steady_clock::now() - start)
                           .count();
    return point;
}

std::vector<SweepPoint> ParameterSweep::run(ProgressCallback progress) const {
    std::vector<double> grid = parameterGrid();
    std::vector<SweepPoint> points;
    points.reserve(grid.size());
    for (size_t i = 0; i < grid.size(); ++i) {
        points.push_back(computePoint(grid[i]));
        if (progress) {
            progress(static_cast<int>(i + 1), static_cast<int>(grid.size()));
        }
    }
    return points;
}

SweepSummary ParameterSweep::summarize(std::vector<SweepPoint> const& points) {
    SweepSummary summary;
    summary.points = static_cast<int>(points.size());
    bool first = true;
    for (auto const& p : points) {
        if (first || p.metric.ctm > summary.max_ctm) {
            summary.max_ctm = p.metric.ctm;
            summary.max_ctm_b = p.b;
        }
        if (first || p.spectrum.lambda1() > summary.max_lambda1) {
            summary.max_lambda1 = p.spectrum.lambda1();
            summary.max_lambda1_b = p.b;
        }
        first = false;

        if (p.spectrum.lambda1() > 0.0 &&
            (!summary.chaos_boundary || p.b > *summary.chaos_boundary)) {
            summary.chaos_boundary = p.b;
        }
        ++summary.regime_counts[magic_enum::enum_integer(p.metric.regime)];
        summary.total_ms += p.elapsed_ms;
    }
    return summary;
}

nlohmann::json ParameterSweep::toJSON(std::vector<SweepPoint> const& points,
                                      SweepSummary const& summary) {
    nlohmann::json j;
    j["summary"] = summary.toJSON();
    nlohmann::json arr = nlohmann::json::array();
    for (auto const& p : points) {
        arr.push_back(p.toJSON());
    }
    j["points"] = arr;
    return j;
}
