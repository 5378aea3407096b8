#include "chaos/lyapunov.h"
#include "enum_utils.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>

namespace chaos {

namespace {

constexpr size_t MAX_WINDOWS = 100;
constexpr int MIN_WINDOWS_FOR_INTERVAL = 10;
constexpr size_t CONVERGENCE_SPAN = 5;
constexpr double SUM_IDENTITY_TOLERANCE = 0.01;

// A column whose residual after projection falls below this fraction of its
// input length is treated as linearly dependent
constexpr double DEGENERATE_RATIO = 1e-12;

std::array<Vec3, 3> identityFrame() {
    return {{{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}}};
}

bool isZero(Vec3 const& v) {
    return v[0] == 0.0 && v[1] == 0.0 && v[2] == 0.0;
}

double mean(std::vector<double>::const_iterator first, std::vector<double>::const_iterator last) {
    double sum = 0.0;
    size_t n = 0;
    for (auto it = first; it != last; ++it, ++n) {
        sum += *it;
    }
    return n > 0 ? sum / n : 0.0;
}

} // namespace

double kaplanYorkeDimension(std::span<double const> exponents) {
    std::vector<double> sorted(exponents.begin(), exponents.end());
    std::sort(sorted.begin(), sorted.end(), std::greater<>());

    size_t k = 0;
    double partial = 0.0;
    while (k < sorted.size() && partial + sorted[k] >= 0.0) {
        partial += sorted[k];
        ++k;
    }

    if (k == 0) {
        return 0.0;
    }
    if (k == sorted.size()) {
        return static_cast<double>(k);
    }
    return static_cast<double>(k) + partial / std::abs(sorted[k]);
}

std::array<double, 3> orthonormalize(std::array<Vec3, 3>& frame) {
    std::array<double, 3> r_diag{};
    for (size_t i = 0; i < 3; ++i) {
        Vec3 v = frame[i];
        double input_norm = norm(v);
        for (size_t j = 0; j < i; ++j) {
            if (!isZero(frame[j])) {
                v = v - dot(frame[j], v) * frame[j];
            }
        }
        double r = norm(v);
        if (!std::isfinite(r) || r <= DEGENERATE_RATIO * input_norm || r <= 0.0) {
            frame[i] = {0.0, 0.0, 0.0};
            r_diag[i] = 0.0;
            continue;
        }
        frame[i] = (1.0 / r) * v;
        r_diag[i] = r;
    }
    return r_diag;
}

void completeFrame(std::array<Vec3, 3>& frame) {
    for (size_t i = 0; i < 3; ++i) {
        if (!isZero(frame[i])) {
            continue;
        }
        // Pick the basis direction least aligned with the existing columns
        Vec3 best{};
        double best_norm = 0.0;
        for (Vec3 const& e : identityFrame()) {
            Vec3 v = e;
            for (size_t j = 0; j < 3; ++j) {
                if (j != i && !isZero(frame[j])) {
                    v = v - dot(frame[j], v) * frame[j];
                }
            }
            double n = norm(v);
            if (n > best_norm) {
                best_norm = n;
                best = v;
            }
        }
        frame[i] = (1.0 / best_norm) * best;
    }
}

double orthonormalityError(std::array<Vec3, 3> const& frame) {
    double worst = 0.0;
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = i; j < 3; ++j) {
            double target = (i == j) ? 1.0 : 0.0;
            worst = std::max(worst, std::abs(dot(frame[i], frame[j]) - target));
        }
    }
    return worst;
}

nlohmann::json LyapunovSpectrum::toJSON() const {
    nlohmann::json j;
    j["exponents"] = exponents;
    j["lambda1"] = lambda1();
    j["kaplan_yorke"] = kaplan_yorke;
    j["sum"] = sum;
    j["expected_sum"] = expected_sum;
    j["sum_error"] = sum_error;
    j["sum_identity_ok"] = sum_identity_ok;
    j["b"] = b;
    j["dt"] = dt;
    j["steps"] = steps;
    j["skip_transient"] = skip_transient;
    j["phase"] = enum_utils::toString(phase);
    j["converged"] = converged;
    if (lambda1_interval) {
        j["lambda1_interval"] = {{"lower", lambda1_interval->lower},
                                 {"upper", lambda1_interval->upper},
                                 {"level", lambda1_interval->level},
                                 {"windows", lambda1_interval->windows}};
    } else {
        j["lambda1_interval"] = nullptr;
    }
    j["computation_ms"] = computation_ms;
    return j;
}

LyapunovEstimator::LyapunovEstimator(ThomasSystem const& system, double dt,
                                     LyapunovParams const& params)
    : system_(system), dt_(dt), params_(params) {
    if (!(dt > 0.0) || !std::isfinite(dt)) {
        throw std::invalid_argument("Lyapunov estimator requires a positive time step");
    }
    params_.qr_interval = std::max(1, params_.qr_interval);
    params_.ftle_window = std::max(1, params_.ftle_window);
    params_.convergence_interval = std::max(1, params_.convergence_interval);
}

void LyapunovEstimator::reset() {
    phase_ = EstimatorPhase::Uninitialized;
    state_ = {};
    frame_ = {};
    log_sums_ = {};
    target_steps_ = 0;
    skip_transient_ = 0;
    transient_left_ = 0;
    accumulated_ = 0;
    since_qr_ = 0;
    window_start_sum_ = 0.0;
    window_start_step_ = 0;
    window_estimates_.clear();
    convergence_history_.clear();
    elapsed_ms_ = 0.0;
}

void LyapunovEstimator::begin(Vec3 const& state, int steps, int skip_transient) {
    if (steps <= 0) {
        throw std::invalid_argument("Lyapunov spectrum needs a positive step count");
    }
    if (skip_transient < 0) {
        throw std::invalid_argument("skip_transient cannot be negative");
    }
    if (!isFinite(state)) {
        throw std::invalid_argument("Lyapunov estimator needs a finite initial state");
    }

    reset();
    state_ = state;
    frame_ = identityFrame();
    target_steps_ = steps;
    skip_transient_ = skip_transient;
    transient_left_ = skip_transient;
    phase_ = transient_left_ > 0 ? EstimatorPhase::WarmingUp : EstimatorPhase::Accumulating;
    started_at_ = std::chrono::steady_clock::now();
}

bool LyapunovEstimator::step() {
    switch (phase_) {
    case EstimatorPhase::Uninitialized:
        throw std::logic_error("LyapunovEstimator::step called before begin");
    case EstimatorPhase::WarmingUp:
        state_ = system_.step(state_, dt_);
        if (--transient_left_ == 0) {
            phase_ = EstimatorPhase::Accumulating;
        }
        return true;
    case EstimatorPhase::Accumulating:
        accumulateStep();
        if (accumulated_ >= target_steps_) {
            if (since_qr_ > 0) {
                reorthonormalize();
            }
            elapsed_ms_ = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started_at_)
                              .count();
            phase_ = EstimatorPhase::EstimateAvailable;
            return false;
        }
        return true;
    case EstimatorPhase::EstimateAvailable:
        return false;
    }
    return false;
}

void LyapunovEstimator::accumulateStep() {
    state_ = system_.stepWithTangents(state_, frame_, dt_);
    ++accumulated_;
    if (++since_qr_ >= params_.qr_interval) {
        reorthonormalize();
    }

    if (accumulated_ % params_.convergence_interval == 0) {
        convergence_history_.push_back(log_sums_[0] / (accumulated_ * dt_));
    }
}

void LyapunovEstimator::reorthonormalize() {
    auto r_diag = orthonormalize(frame_);
    for (size_t i = 0; i < 3; ++i) {
        // Degenerate columns contribute nothing to their sum
        if (r_diag[i] > 0.0) {
            log_sums_[i] += std::log(r_diag[i]);
        }
    }
    completeFrame(frame_);
    since_qr_ = 0;

    int window_steps = accumulated_ - window_start_step_;
    if (window_steps >= params_.ftle_window) {
        window_estimates_.push_back((log_sums_[0] - window_start_sum_) / (window_steps * dt_));
        if (window_estimates_.size() > MAX_WINDOWS) {
            window_estimates_.pop_front();
        }
        window_start_sum_ = log_sums_[0];
        window_start_step_ = accumulated_;
    }
}

bool LyapunovEstimator::converged() const {
    if (convergence_history_.size() < 2 * CONVERGENCE_SPAN) {
        return false;
    }
    auto end = convergence_history_.end();
    double recent = mean(end - CONVERGENCE_SPAN, end);
    double older = mean(end - 2 * CONVERGENCE_SPAN, end - CONVERGENCE_SPAN);
    return std::abs(recent - older) < params_.convergence_tolerance;
}

std::optional<ConfidenceInterval> LyapunovEstimator::lambda1Interval() const {
    if (window_estimates_.size() < static_cast<size_t>(MIN_WINDOWS_FOR_INTERVAL)) {
        return std::nullopt;
    }
    std::vector<double> sorted(window_estimates_.begin(), window_estimates_.end());
    std::sort(sorted.begin(), sorted.end());
    size_t n = sorted.size();
    ConfidenceInterval ci;
    ci.lower = sorted[static_cast<size_t>(std::floor(0.025 * n))];
    ci.upper = sorted[std::min(n - 1, static_cast<size_t>(std::floor(0.975 * n)))];
    ci.windows = static_cast<int>(n);
    return ci;
}

LyapunovSpectrum LyapunovEstimator::estimate() const {
    if (accumulated_ == 0) {
        throw std::logic_error("No accumulated steps to estimate a spectrum from");
    }

    LyapunovSpectrum result;
    double total_time = accumulated_ * dt_;
    for (size_t i = 0; i < 3; ++i) {
        result.exponents[i] = log_sums_[i] / total_time;
    }
    std::sort(result.exponents.begin(), result.exponents.end(), std::greater<>());

    result.kaplan_yorke = kaplanYorkeDimension(result.exponents);
    result.sum = result.exponents[0] + result.exponents[1] + result.exponents[2];
    result.expected_sum = system_.divergence();
    result.sum_error = std::abs(result.sum - result.expected_sum);
    result.sum_identity_ok = result.sum_error < SUM_IDENTITY_TOLERANCE;

    result.b = system_.b();
    result.dt = dt_;
    result.steps = accumulated_;
    result.skip_transient = skip_transient_;
    result.phase = phase_;
    result.converged = converged();
    result.lambda1_interval = lambda1Interval();
    result.computation_ms = elapsed_ms_;
    return result;
}

LyapunovSpectrum LyapunovEstimator::run(Vec3 const& state, int steps, int skip_transient) {
    begin(state, steps, skip_transient);
    while (step()) {
    }
    return estimate();
}

} // namespace chaos
