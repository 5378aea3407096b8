#include "field/spatial_analyzer.h"
#include "enum_utils.h"
#include "field/density_field.h"
#include "field/local_lyapunov.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>

namespace field {

namespace {

using Clock = std::chrono::steady_clock;

double msSince(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

// Rescales a non-negative grid so that sum * cellVolume == 1
void normalizeMass(ScalarGrid& grid, double cell_volume) {
    double total = 0.0;
    for (double v : grid) {
        total += v;
    }
    if (total <= 0.0) {
        return;
    }
    double scale = 1.0 / (total * cell_volume);
    for (double& v : grid) {
        v *= scale;
    }
}

} // namespace

SpatialFieldAnalyzer::SpatialFieldAnalyzer(Config const& config)
    : geometry_{config.field.resolution, config.field.half_range}, field_params_(config.field),
      streamline_params_(config.streamlines), verbose_(config.output.verbose),
      store_(static_cast<size_t>(std::max(1, config.trajectory.analysis_capacity))),
      hash_(config.field.half_range, config.acceleration.hash_divisions,
            config.acceleration.hash_radius),
      stochastic_(config.field.half_range, config.acceleration) {}

void SpatialFieldAnalyzer::ingest(std::span<Vec3 const> positions, ThomasSystem const& system,
                                  double end_time, double dt) {
    size_t n = positions.size();
    for (size_t i = 0; i < n; ++i) {
        TrajectorySample sample;
        sample.position = positions[i];
        sample.velocity = system.velocity(positions[i]);
        sample.timestamp = end_time - static_cast<double>(n - 1 - i) * dt;
        store_.push(sample);
    }
}

void SpatialFieldAnalyzer::markStale() {
    stale_ = true;
    stochastic_.clearCache();
}

DensityMethod SpatialFieldAnalyzer::resolveDensityMethod(size_t samples) const {
    if (field_params_.density_method != DensityMethod::Auto) {
        return field_params_.density_method;
    }
    double cost = static_cast<double>(geometry_.cellCount()) * static_cast<double>(samples);
    return cost > field_params_.exact_budget ? DensityMethod::Stochastic : DensityMethod::Exact;
}

std::shared_ptr<FieldSnapshot const> SpatialFieldAnalyzer::analyze(ThomasSystem const& system,
                                                                   uint64_t epoch) {
    auto pass_start = Clock::now();

    // The pass works on a copy; later pushes do not affect it
    std::vector<TrajectorySample> samples = store_.snapshot();
    std::vector<Vec3> positions;
    positions.reserve(samples.size());
    for (auto const& s : samples) {
        positions.push_back(s.position);
    }

    auto next = std::make_shared<FieldSnapshot>();
    next->geometry = geometry_;
    next->epoch = epoch;
    next->b = system.b();
    next->velocity_mode = field_params_.velocity_mode;
    next->density_method = resolveDensityMethod(positions.size());

    // Density
    auto t = Clock::now();
    next->histogram_density = histogramDensity(geometry_, positions);
    if (next->density_method == DensityMethod::Stochastic) {
        if (!stochastic_.fitted() || stochastic_fit_b_ != system.b()) {
            stochastic_.fit(system);
            stochastic_fit_b_ = system.b();
        }
        next->kde_density = stochastic_.fillGrid(geometry_);
        normalizeMass(next->kde_density, geometry_.cellVolume());
    } else {
        next->kde_density =
            kernelDensity(geometry_, positions, field_params_.kernel_bandwidth);
    }
    next->timing.density_ms = msSince(t);

    // Global statistics
    t = Clock::now();
    auto& stats = next->statistics;
    stats.entropy = shannonEntropy(next->kde_density, field_params_.min_density);
    stats.correlation_dimension = correlationDimension(positions);
    stats.information_dimension = informationDimension(positions);
    stats.max_density = next->kde_density.empty()
                            ? 0.0
                            : *std::max_element(next->kde_density.begin(),
                                                next->kde_density.end());
    stats.sample_count = positions.size();
    stats.mean = store_.mean();
    stats.covariance = store_.covariance();
    next->timing.statistics_ms = msSince(t);

    // Velocity and its derivatives
    t = Clock::now();
    hash_.rebuild(positions);
    if (field_params_.velocity_mode == VelocityMode::Sampled) {
        next->velocity = sampledVelocity(geometry_, samples, hash_);
    } else {
        next->velocity = analyticVelocity(geometry_, system);
    }
    next->gradient = gradientTensors(geometry_, system);
    next->divergence = divergenceGrid(geometry_, next->velocity.velocity);
    next->vorticity = vorticityGrid(geometry_, next->velocity.velocity);
    next->timing.velocity_ms = msSince(t);

    // Eigenstructure and critical points
    t = Clock::now();
    next->eigen = eigenGrid(next->gradient);
    next->critical_points = findCriticalPoints(geometry_, next->velocity, next->eigen,
                                               field_params_.critical_threshold);
    next->topology = summarizeTopology(next->critical_points);
    next->timing.topology_ms = msSince(t);

    t = Clock::now();
    next->streamlines = generateStreamlines(system, geometry_.half_range, streamline_params_);
    next->timing.streamline_ms = msSince(t);

    t = Clock::now();
    LocalLyapunovParams probe{field_params_.local_lyapunov_dt,
                              field_params_.local_lyapunov_iterations,
                              field_params_.escape_bound};
    next->local_lyapunov = localLyapunovGrid(geometry_, system, probe);
    stats.mean_local_lyapunov = finiteMean(next->local_lyapunov);
    next->timing.local_lyapunov_ms = msSince(t);

    next->timing.total_ms = msSince(pass_start);

    if (verbose_) {
        std::cout << "Field pass: " << positions.size() << " samples, N="
                  << geometry_.resolution << ", density="
                  << enum_utils::toString(next->density_method) << ", "
                  << next->critical_points.size() << " critical points, "
                  << next->streamlines.size() << " streamlines, " << std::fixed
                  << std::setprecision(1) << next->timing.total_ms << " ms\n"
                  << std::defaultfloat;
    }

    current_ = std::move(next);
    stale_ = false;
    return current_;
}

} // namespace field
