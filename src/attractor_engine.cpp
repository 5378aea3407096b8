#include "attractor_engine.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void requirePositive(double value, char const* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw std::invalid_argument(std::string(name) + " must be positive and finite");
    }
}

void requireFinite(Vec3 const& seed) {
    if (!isFinite(seed)) {
        throw std::invalid_argument("seed must have three finite components");
    }
}

// Validates before any member is built so a bad config leaves nothing behind
Config const& validated(Config const& config) {
    requirePositive(config.model.b, "b");
    requirePositive(config.model.dt, "dt");
    requireFinite(config.model.seed);
    return config;
}

} // namespace

nlohmann::json ModelParameters::toJSON() const {
    nlohmann::json j;
    j["b"] = b;
    j["dt"] = dt;
    j["seed"] = seed;
    j["state"] = state;
    j["time"] = time;
    j["steps"] = steps;
    j["epoch"] = epoch;
    return j;
}

AttractorEngine::AttractorEngine(Config const& config)
    : config_(validated(config)), system_(config.model.b), dt_(config.model.dt),
      seed_(config.model.seed), state_(config.model.seed),
      recent_(static_cast<size_t>(std::max(2, config.trajectory.recent_capacity))),
      quick_(config.lyapunov.quick_window,
             std::chrono::milliseconds(config.lyapunov.quick_cache_ms)),
      analyzer_(config) {
    runTransient();
}

void AttractorEngine::runTransient() {
    for (int i = 0; i < config_.model.transient_steps; ++i) {
        state_ = system_.step(state_, dt_);
    }
}

std::vector<Vec3> AttractorEngine::step(int n) {
    if (n < 0) {
        throw std::invalid_argument("step count cannot be negative");
    }
    std::vector<Vec3> positions;
    positions.reserve(n);
    for (int i = 0; i < n; ++i) {
        state_ = system_.step(state_, dt_);
        time_ += dt_;
        ++steps_;
        recent_.push({state_, system_.velocity(state_), time_});
        positions.push_back(state_);
    }
    return positions;
}

ModelParameters AttractorEngine::getParameters() const {
    ModelParameters p;
    p.b = system_.b();
    p.dt = dt_;
    p.seed = seed_;
    p.state = state_;
    p.time = time_;
    p.steps = steps_;
    p.epoch = epoch_;
    return p;
}

void AttractorEngine::invalidateDerived() {
    ++epoch_;
    last_spectrum_.reset();
    quick_.invalidate();
    analyzer_.markStale();
}

void AttractorEngine::setB(double b) {
    requirePositive(b, "b");
    system_ = ThomasSystem(b);
    config_.model.b = b;
    invalidateDerived();
}

void AttractorEngine::setDt(double dt) {
    requirePositive(dt, "dt");
    dt_ = dt;
    config_.model.dt = dt;
    invalidateDerived();
}

void AttractorEngine::reset(std::optional<Vec3> seed) {
    if (seed) {
        requireFinite(*seed);
        seed_ = *seed;
    }
    state_ = seed_;
    time_ = 0.0;
    steps_ = 0;
    recent_.clear();
    analyzer_.clearSamples();
    invalidateDerived();
    runTransient();
}

chaos::LyapunovSpectrum AttractorEngine::computeLyapunovSpectrum(int steps, int skip_transient) {
    chaos::LyapunovEstimator estimator(system_, dt_, config_.lyapunov);
    chaos::LyapunovSpectrum spectrum = estimator.run(state_, steps, skip_transient);
    last_spectrum_ = spectrum;
    if (config_.output.verbose) {
        std::cout << "Lyapunov spectrum: [" << spectrum.exponents[0] << ", "
                  << spectrum.exponents[1] << ", " << spectrum.exponents[2]
                  << "], D_KY=" << spectrum.kaplan_yorke << " (" << spectrum.computation_ms
                  << " ms)\n";
        if (!spectrum.sum_identity_ok) {
            std::cerr << "Warning: exponent sum " << spectrum.sum << " deviates from -3b = "
                      << spectrum.expected_sum << "\n";
        }
    }
    return spectrum;
}

chaos::LyapunovSpectrum AttractorEngine::computeLyapunovSpectrum() {
    return computeLyapunovSpectrum(config_.lyapunov.steps, config_.lyapunov.skip_transient);
}

double AttractorEngine::quickLyapunov() {
    return quick_.estimate(recent_);
}

double AttractorEngine::quickLyapunov(chaos::QuickLyapunov::Clock::time_point now) {
    return quick_.estimate(recent_, now);
}

chaos::ChaosMetric AttractorEngine::computeChaosMetric() {
    if (!last_spectrum_) {
        computeLyapunovSpectrum(config_.lyapunov.metric_steps,
                                config_.lyapunov.metric_skip_transient);
    }
    return chaos::computeChaosMetric(last_spectrum_->lambda1(), last_spectrum_->kaplan_yorke,
                                     system_.b());
}

std::shared_ptr<field::FieldSnapshot const>
AttractorEngine::analyzeSpatialField(std::span<Vec3 const> batch) {
    analyzer_.ingest(batch, system_, time_, dt_);
    return analyzer_.analyze(system_, epoch_);
}
