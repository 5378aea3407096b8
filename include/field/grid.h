#pragma once

#include "vec3.h"

#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <vector>

namespace field {

using ScalarGrid = std::vector<double>;
using VectorGrid = std::vector<Vec3>;
using TensorGrid = std::vector<Mat3>;

// Cube [-R, R]^3 split into N^3 cells, flattened as i + j*N + k*N^2
struct GridGeometry {
    int resolution = 32;
    double half_range = 10.0;

    double cellSize() const { return 2.0 * half_range / resolution; }
    double cellVolume() const {
        double s = cellSize();
        return s * s * s;
    }
    size_t cellCount() const {
        return static_cast<size_t>(resolution) * resolution * resolution;
    }

    size_t index(int i, int j, int k) const {
        return static_cast<size_t>(i) + static_cast<size_t>(j) * resolution +
               static_cast<size_t>(k) * resolution * resolution;
    }

    std::array<int, 3> coords(size_t idx) const {
        int n = resolution;
        return {static_cast<int>(idx % n), static_cast<int>((idx / n) % n),
                static_cast<int>(idx / (static_cast<size_t>(n) * n))};
    }

    Vec3 cellCenter(int i, int j, int k) const {
        double s = cellSize();
        return {-half_range + (i + 0.5) * s, -half_range + (j + 0.5) * s,
                -half_range + (k + 0.5) * s};
    }

    Vec3 cellCenter(size_t idx) const {
        auto [i, j, k] = coords(idx);
        return cellCenter(i, j, k);
    }

    // Cell containing p, or nullopt outside the cube
    std::optional<std::array<int, 3>> cellOf(Vec3 const& p) const {
        double s = cellSize();
        std::array<int, 3> c{};
        for (int a = 0; a < 3; ++a) {
            double f = std::floor((p[a] + half_range) / s);
            if (!(f >= 0.0) || f >= resolution) {
                return std::nullopt;
            }
            c[a] = static_cast<int>(f);
        }
        return c;
    }

    bool isInterior(int i, int j, int k) const {
        return i > 0 && j > 0 && k > 0 && i < resolution - 1 && j < resolution - 1 &&
               k < resolution - 1;
    }

    bool contains(Vec3 const& p) const {
        return std::abs(p[0]) <= half_range && std::abs(p[1]) <= half_range &&
               std::abs(p[2]) <= half_range;
    }
};

// Packs signed integer cell coordinates into one 64-bit hash key (21 bits each)
inline uint64_t packCellKey(int64_t i, int64_t j, int64_t k) {
    constexpr int64_t OFFSET = int64_t{1} << 20;
    constexpr uint64_t MASK = (uint64_t{1} << 21) - 1;
    return (static_cast<uint64_t>(i + OFFSET) & MASK) |
           ((static_cast<uint64_t>(j + OFFSET) & MASK) << 21) |
           ((static_cast<uint64_t>(k + OFFSET) & MASK) << 42);
}

} // namespace field
