#include "trajectory_store.h"

#include <stdexcept>

TrajectoryStore::TrajectoryStore(size_t capacity) : buffer_(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("TrajectoryStore capacity must be positive");
    }
}

void TrajectoryStore::push(TrajectorySample const& sample) {
    if (full()) {
        removeMoments(buffer_[head_].position);
        --count_;
        head_ = (head_ + 1) % buffer_.size();
    }
    buffer_[(head_ + count_) % buffer_.size()] = sample;
    ++count_;
    addMoments(sample.position);
    ++total_pushed_;
}

void TrajectoryStore::clear() {
    head_ = 0;
    count_ = 0;
    total_pushed_ = 0;
    mean_ = {};
    comoment_ = {};
}

TrajectorySample const& TrajectoryStore::at(size_t i) const {
    if (i >= count_) {
        throw std::out_of_range("TrajectoryStore index out of range");
    }
    return buffer_[(head_ + i) % buffer_.size()];
}

std::vector<TrajectorySample> TrajectoryStore::snapshot() const {
    std::vector<TrajectorySample> result;
    result.reserve(count_);
    for (size_t i = 0; i < count_; ++i) {
        result.push_back(buffer_[(head_ + i) % buffer_.size()]);
    }
    return result;
}

std::vector<Vec3> TrajectoryStore::positions() const {
    std::vector<Vec3> result;
    result.reserve(count_);
    for (size_t i = 0; i < count_; ++i) {
        result.push_back(buffer_[(head_ + i) % buffer_.size()].position);
    }
    return result;
}

// count_ already includes x
void TrajectoryStore::addMoments(Vec3 const& x) {
    double n = static_cast<double>(count_);
    Vec3 delta = x - mean_;
    mean_ += (1.0 / n) * delta;
    Vec3 delta_after = x - mean_;
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            comoment_[r][c] += delta[r] * delta_after[c];
        }
    }
}

// Inverse of addMoments: count_ still includes x
void TrajectoryStore::removeMoments(Vec3 const& x) {
    if (count_ <= 1) {
        mean_ = {};
        comoment_ = {};
        return;
    }
    double n = static_cast<double>(count_);
    Vec3 mean_without = (1.0 / (n - 1.0)) * (n * mean_ - x);
    Vec3 delta_before = x - mean_without;
    Vec3 delta_after = x - mean_;
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            comoment_[r][c] -= delta_before[r] * delta_after[c];
        }
    }
    mean_ = mean_without;
}

Mat3 TrajectoryStore::covariance() const {
    Mat3 cov{};
    if (count_ < 2) {
        return cov;
    }
    double denom = static_cast<double>(count_ - 1);
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            cov[r][c] = comoment_[r][c] / denom;
        }
    }
    return cov;
}

nlohmann::json TrajectoryStore::statisticsJSON() const {
    nlohmann::json j;
    j["count"] = count_;
    j["capacity"] = buffer_.size();
    j["total_pushed"] = total_pushed_;
    j["mean"] = mean_;
    j["covariance"] = covariance();
    return j;
}
