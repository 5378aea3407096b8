#pragma once

#include "timed_cache.h"
#include "trajectory_store.h"

#include <chrono>
#include <span>

namespace chaos {

// Growth rate of successive point separations over a run of samples:
// sum(log(d_i / d_{i-1})) / elapsed time. Zero separations are skipped.
// Returns 0 with fewer than 3 samples or no elapsed time.
double separationGrowthRate(std::span<TrajectorySample const> samples);

// Cheap lambda1 approximation from the newest samples of a trajectory store,
// held for a fixed wall-clock interval. Not a substitute for the full spectrum.
class QuickLyapunov {
public:
    using Clock = std::chrono::steady_clock;

    QuickLyapunov(int window, std::chrono::milliseconds cache_duration);

    double estimate(TrajectoryStore const& store, Clock::time_point now);
    double estimate(TrajectoryStore const& store) { return estimate(store, Clock::now()); }

    // Forget the cached value (parameter change or reset)
    void invalidate() { cache_.clear(); }

    bool hasCachedValue(Clock::time_point now) const {
        return cache_.get(CACHE_KEY, now).has_value();
    }

    int window() const { return window_; }

private:
    static constexpr int CACHE_KEY = 0;

    int window_;
    TimedCache<int, double, Clock> cache_;
};

} // namespace chaos
