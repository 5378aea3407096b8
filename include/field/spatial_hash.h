#pragma once

#include "field/grid.h"
#include "vec3.h"

#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace field {

// Uniform hash of sample indices over coarse buckets covering [-R, R]^3.
// Buckets are divisions-per-axis coarser than the analysis grid; points
// outside the cube are still hashed into their (out-of-range) bucket.
class SpatialHash {
public:
    SpatialHash(double half_range, int divisions, int radius);

    // Replaces the contents with the given points (indices refer to `points`)
    void rebuild(std::span<Vec3 const> points);

    // Candidate indices from the (2r+1)^3 bucket block around p, where r is
    // the configured radius widened so the block covers `search_radius`
    std::vector<uint32_t> candidates(Vec3 const& p, double search_radius) const;

    // Indices whose point lies within `search_radius` of p
    std::vector<uint32_t> within(Vec3 const& p, double search_radius) const;

    double bucketSize() const { return bucket_size_; }
    size_t bucketCount() const { return buckets_.size(); }
    size_t pointCount() const { return points_.size(); }

private:
    std::array<int64_t, 3> bucketOf(Vec3 const& p) const;

    double half_range_;
    double bucket_size_;
    int radius_;
    std::vector<Vec3> points_;
    std::unordered_map<uint64_t, std::vector<uint32_t>> buckets_;
};

} // namespace field
