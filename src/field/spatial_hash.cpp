#include "field/spatial_hash.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace field {

SpatialHash::SpatialHash(double half_range, int divisions, int radius)
    : half_range_(half_range), bucket_size_(2.0 * half_range / divisions),
      radius_(std::max(0, radius)) {
    if (!(half_range > 0.0) || divisions <= 0) {
        throw std::invalid_argument("SpatialHash needs a positive range and division count");
    }
}

std::array<int64_t, 3> SpatialHash::bucketOf(Vec3 const& p) const {
    return {static_cast<int64_t>(std::floor((p[0] + half_range_) / bucket_size_)),
            static_cast<int64_t>(std::floor((p[1] + half_range_) / bucket_size_)),
            static_cast<int64_t>(std::floor((p[2] + half_range_) / bucket_size_))};
}

void SpatialHash::rebuild(std::span<Vec3 const> points) {
    buckets_.clear();
    points_.assign(points.begin(), points.end());
    for (uint32_t i = 0; i < points_.size(); ++i) {
        if (!isFinite(points_[i])) {
            continue;
        }
        auto [bx, by, bz] = bucketOf(points_[i]);
        buckets_[packCellKey(bx, by, bz)].push_back(i);
    }
}

std::vector<uint32_t> SpatialHash::candidates(Vec3 const& p, double search_radius) const {
    std::vector<uint32_t> result;
    if (buckets_.empty()) {
        return result;
    }

    int64_t r = std::max<int64_t>(radius_,
                                  static_cast<int64_t>(std::ceil(search_radius / bucket_size_)));
    auto [cx, cy, cz] = bucketOf(p);
    for (int64_t dz = -r; dz <= r; ++dz) {
        for (int64_t dy = -r; dy <= r; ++dy) {
            for (int64_t dx = -r; dx <= r; ++dx) {
                auto it = buckets_.find(packCellKey(cx + dx, cy + dy, cz + dz));
                if (it != buckets_.end()) {
                    result.insert(result.end(), it->second.begin(), it->second.end());
                }
            }
        }
    }
    return result;
}

std::vector<uint32_t> SpatialHash::within(Vec3 const& p, double search_radius) const {
    std::vector<uint32_t> result;
    for (uint32_t idx : candidates(p, search_radius)) {
        if (distance(points_[idx], p) <= search_radius) {
            result.push_back(idx);
        }
    }
    return result;
}

} // namespace field
