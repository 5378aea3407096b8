#pragma once

#include "vec3.h"

#include <cstddef>
#include <nlohmann/json.hpp>
#include <vector>

struct TrajectorySample {
    Vec3 position{};
    Vec3 velocity{};
    double timestamp = 0.0; // Simulation time
};

// Bounded FIFO ring of trajectory samples with running first and second
// moments (Welford). Evicting a sample reverses its contribution exactly,
// so mean() and covariance() always describe the current contents.
class TrajectoryStore {
public:
    explicit TrajectoryStore(size_t capacity);

    void push(TrajectorySample const& sample);
    void clear();

    size_t size() const { return count_; }
    size_t capacity() const { return buffer_.size(); }
    bool empty() const { return count_ == 0; }
    bool full() const { return count_ == buffer_.size(); }

    // Index 0 is the oldest retained sample
    TrajectorySample const& at(size_t i) const;
    TrajectorySample const& back() const { return at(count_ - 1); }

    // Copies of the current contents, oldest first
    std::vector<TrajectorySample> snapshot() const;
    std::vector<Vec3> positions() const;

    // Samples pushed since construction or the last clear(), evicted ones included
    size_t totalPushed() const { return total_pushed_; }

    Vec3 mean() const { return mean_; }

    // Sample covariance (n-1 normalization), zero with fewer than 2 samples
    Mat3 covariance() const;

    nlohmann::json statisticsJSON() const;

private:
    void addMoments(Vec3 const& x);
    void removeMoments(Vec3 const& x);

    std::vector<TrajectorySample> buffer_;
    size_t head_ = 0; // Slot of the oldest sample
    size_t count_ = 0;
    size_t total_pushed_ = 0;

    Vec3 mean_{};
    Mat3 comoment_{}; // Sum of (x - mean)(x - mean)^T
};
