#pragma once

#include "chaos/chaos_metric.h"
#include "chaos/lyapunov.h"
#include "chaos/quick_lyapunov.h"
#include "config.h"
#include "field/spatial_analyzer.h"
#include "thomas_system.h"
#include "trajectory_store.h"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <vector>

struct ModelParameters {
    double b = 0.0;
    double dt = 0.0;
    Vec3 seed{};
    Vec3 state{};
    double time = 0.0;
    long steps = 0;     // Steps taken since the last reset
    uint64_t epoch = 0; // Bumped by every change that invalidates derived results

    nlohmann::json toJSON() const;
};

// Entry point for a presentation shell: owns the integrator state, the
// recent-trajectory ring, the spectrum cache and the spatial analyzer.
// Changing b, dt or the seed starts a new epoch: the cached spectrum and quick
// estimate are dropped and the published field snapshot is marked stale.
class AttractorEngine {
public:
    explicit AttractorEngine(Config const& config);

    // Advance n steps and return the produced positions
    std::vector<Vec3> step(int n);

    ModelParameters getParameters() const;

    // Throw std::invalid_argument for non-positive or non-finite values;
    // the engine is unchanged in that case
    void setB(double b);
    void setDt(double dt);
    void reset(std::optional<Vec3> seed = std::nullopt);

    // Full spectrum from the current state (the engine's own state is not advanced)
    chaos::LyapunovSpectrum computeLyapunovSpectrum(int steps, int skip_transient);
    chaos::LyapunovSpectrum computeLyapunovSpectrum();

    double quickLyapunov();
    double quickLyapunov(chaos::QuickLyapunov::Clock::time_point now);

    // Uses the spectrum of the current epoch when there is one, otherwise
    // runs a short spectrum first
    chaos::ChaosMetric computeChaosMetric();

    // Folds the batch into the analysis ring, then runs a full pass
    std::shared_ptr<field::FieldSnapshot const> analyzeSpatialField(std::span<Vec3 const> batch);

    std::shared_ptr<field::FieldSnapshot const> fieldSnapshot() const {
        return analyzer_.snapshot();
    }
    bool fieldStale() const { return analyzer_.stale(); }

    std::optional<chaos::LyapunovSpectrum> const& lastSpectrum() const { return last_spectrum_; }
    ThomasSystem const& system() const { return system_; }
    Vec3 const& state() const { return state_; }
    TrajectoryStore const& recentTrajectory() const { return recent_; }
    field::SpatialFieldAnalyzer const& analyzer() const { return analyzer_; }
    Config const& config() const { return config_; }

private:
    void invalidateDerived();
    void runTransient();

    Config config_;
    ThomasSystem system_;
    double dt_;
    Vec3 seed_;
    Vec3 state_;
    double time_ = 0.0;
    long steps_ = 0;
    uint64_t epoch_ = 0;

    TrajectoryStore recent_;
    chaos::QuickLyapunov quick_;
    std::optional<chaos::LyapunovSpectrum> last_spectrum_;
    field::SpatialFieldAnalyzer analyzer_;
};
