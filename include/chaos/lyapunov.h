#pragma once

#include "config.h"
#include "thomas_system.h"
#include "vec3.h"

#include <array>
#include <chrono>
#include <deque>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <vector>

namespace chaos {

enum class EstimatorPhase {
    Uninitialized,
    WarmingUp,        // Transient: state advances, tangent frame untouched
    Accumulating,     // Tangent frame evolves, log-growth sums accumulate
    EstimateAvailable // Requested step count reached
};

struct ConfidenceInterval {
    double lower = 0.0;
    double upper = 0.0;
    double level = 0.95;
    int windows = 0; // Finite-time windows the interval is built from
};

struct LyapunovSpectrum {
    std::array<double, 3> exponents{}; // Sorted descending
    double kaplan_yorke = 0.0;

    // Sum identity: exponents should add up to the flow divergence -3b
    double sum = 0.0;
    double expected_sum = 0.0;
    double sum_error = 0.0;
    bool sum_identity_ok = false;

    double b = 0.0;
    double dt = 0.0;
    int steps = 0;
    int skip_transient = 0;

    // Phase the estimator was in when the estimate was taken
    EstimatorPhase phase = EstimatorPhase::Uninitialized;
    bool converged = false;
    std::optional<ConfidenceInterval> lambda1_interval;
    double computation_ms = 0.0;

    double lambda1() const { return exponents[0]; }

    nlohmann::json toJSON() const;
};

// Kaplan-Yorke (Lyapunov) dimension of a spectrum in any order.
// k is the largest count whose leading partial sum stays non-negative;
// D = k + sum_k / |lambda_{k+1}|, with D = 0 when k = 0 and D = n when k = n.
double kaplanYorkeDimension(std::span<double const> exponents);

// Modified Gram-Schmidt on the frame's vectors (treated as matrix columns).
// Returns the diagonal of R. A column that is non-finite or collapses onto the
// earlier columns is replaced by the zero vector and reports R_ii = 0.
std::array<double, 3> orthonormalize(std::array<Vec3, 3>& frame);

// Fills zero columns of a frame with standard basis directions orthogonal
// to the remaining columns, restoring a full orthonormal frame.
void completeFrame(std::array<Vec3, 3>& frame);

// Largest |<q_i, q_j> - delta_ij| over the frame
double orthonormalityError(std::array<Vec3, 3> const& frame);

// Benettin-style estimator of the full Lyapunov spectrum.
// The tangent frame follows the variational RK4 flow and is re-orthonormalized
// every qr_interval steps; log|R_ii| accumulates into running sums.
class LyapunovEstimator {
public:
    LyapunovEstimator(ThomasSystem const& system, double dt, LyapunovParams const& params = {});

    // Enter warm-up from `state`; accumulation covers `steps` steps after
    // `skip_transient` discarded ones.
    void begin(Vec3 const& state, int steps, int skip_transient);

    // Advance one step in the current phase. Returns false once the estimate is available.
    bool step();

    // Drive begin() + step() to completion and return the estimate
    LyapunovSpectrum run(Vec3 const& state, int steps, int skip_transient);

    // Estimate from the steps accumulated so far (requires at least one)
    LyapunovSpectrum estimate() const;

    // Back to Uninitialized; frame and sums discarded
    void reset();

    EstimatorPhase phase() const { return phase_; }
    Vec3 const& state() const { return state_; }
    std::array<Vec3, 3> const& frame() const { return frame_; }
    int accumulatedSteps() const { return accumulated_; }
    std::vector<double> const& convergenceHistory() const { return convergence_history_; }
    bool converged() const;
    std::optional<ConfidenceInterval> lambda1Interval() const;

private:
    void accumulateStep();
    void reorthonormalize();

    ThomasSystem system_;
    double dt_;
    LyapunovParams params_;

    EstimatorPhase phase_ = EstimatorPhase::Uninitialized;
    Vec3 state_{};
    std::array<Vec3, 3> frame_{};
    std::array<double, 3> log_sums_{};

    int target_steps_ = 0;
    int skip_transient_ = 0;
    int transient_left_ = 0;
    int accumulated_ = 0;
    int since_qr_ = 0;

    // Finite-time window bookkeeping for lambda1
    double window_start_sum_ = 0.0;
    int window_start_step_ = 0;
    std::deque<double> window_estimates_;

    std::vector<double> convergence_history_;

    std::chrono::steady_clock::time_point started_at_{};
    double elapsed_ms_ = 0.0;
};

} // namespace chaos
