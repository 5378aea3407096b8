#include "chaos/quick_lyapunov.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace chaos {

double separationGrowthRate(std::span<TrajectorySample const> samples) {
    if (samples.size() < 3) {
        return 0.0;
    }

    double log_sum = 0.0;
    double prev_distance = distance(samples[1].position, samples[0].position);
    for (size_t i = 2; i < samples.size(); ++i) {
        double d = distance(samples[i].position, samples[i - 1].position);
        if (d > 0.0 && prev_distance > 0.0) {
            log_sum += std::log(d / prev_distance);
        }
        prev_distance = d;
    }

    double elapsed = samples.back().timestamp - samples.front().timestamp;
    if (!(elapsed > 0.0) || !std::isfinite(log_sum)) {
        return 0.0;
    }
    return log_sum / elapsed;
}

QuickLyapunov::QuickLyapunov(int window, std::chrono::milliseconds cache_duration)
    : window_(window), cache_(std::chrono::duration_cast<Clock::duration>(cache_duration)) {
    if (window < 3) {
        throw std::invalid_argument("Quick Lyapunov window needs at least 3 samples");
    }
}

double QuickLyapunov::estimate(TrajectoryStore const& store, Clock::time_point now) {
    if (auto cached = cache_.get(CACHE_KEY, now)) {
        return *cached;
    }

    // Only the newest window of the ring is read
    size_t n = std::min(store.size(), static_cast<size_t>(window_));
    std::vector<TrajectorySample> recent;
    recent.reserve(n);
    for (size_t i = store.size() - n; i < store.size(); ++i) {
        recent.push_back(store.at(i));
    }

    double value = separationGrowthRate(recent);
    cache_.put(CACHE_KEY, value, now);
    return value;
}

} // namespace chaos
