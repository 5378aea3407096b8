#include "field/density_field.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace field {

namespace {

uint64_t boxKey(Vec3 const& p, double size) {
    return packCellKey(static_cast<int64_t>(std::floor(p[0] / size)),
                       static_cast<int64_t>(std::floor(p[1] / size)),
                       static_cast<int64_t>(std::floor(p[2] / size)));
}

} // namespace

ScalarGrid histogramDensity(GridGeometry const& grid, std::span<Vec3 const> samples) {
    ScalarGrid density(grid.cellCount(), 0.0);
    if (samples.empty()) {
        return density;
    }

    for (Vec3 const& p : samples) {
        if (auto cell = grid.cellOf(p)) {
            density[grid.index((*cell)[0], (*cell)[1], (*cell)[2])] += 1.0;
        }
    }

    double norm_factor = 1.0 / (static_cast<double>(samples.size()) * grid.cellVolume());
    for (double& d : density) {
        d *= norm_factor;
    }
    return density;
}

ScalarGrid kernelDensity(GridGeometry const& grid, std::span<Vec3 const> samples,
                         double bandwidth) {
    ScalarGrid density(grid.cellCount(), 0.0);
    if (samples.empty() || !(bandwidth > 0.0)) {
        return density;
    }

    double inv_two_h2 = 1.0 / (2.0 * bandwidth * bandwidth);
    double norm_factor = 1.0 / (std::pow(2.0 * M_PI, 1.5) * bandwidth * bandwidth * bandwidth *
                                static_cast<double>(samples.size()));

    for (size_t idx = 0; idx < density.size(); ++idx) {
        Vec3 center = grid.cellCenter(idx);
        double sum = 0.0;
        for (Vec3 const& p : samples) {
            Vec3 d = p - center;
            sum += std::exp(-dot(d, d) * inv_two_h2);
        }
        density[idx] = sum * norm_factor;
    }
    return density;
}

double shannonEntropy(ScalarGrid const& density, double min_density) {
    double total = 0.0;
    for (double d : density) {
        if (d > min_density) {
            total += d;
        }
    }
    if (total <= 0.0) {
        return 0.0;
    }

    double entropy = 0.0;
    for (double d : density) {
        if (d > min_density) {
            double p = d / total;
            entropy -= p * std::log2(p);
        }
    }
    return entropy;
}

double regressionSlope(std::span<double const> x, std::span<double const> y) {
    size_t n = std::min(x.size(), y.size());
    if (n < 2) {
        return 0.0;
    }

    double sum_x = 0.0, sum_y = 0.0, sum_xy = 0.0, sum_xx = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum_x += x[i];
        sum_y += y[i];
        sum_xy += x[i] * y[i];
        sum_xx += x[i] * x[i];
    }

    double denom = n * sum_xx - sum_x * sum_x;
    if (std::abs(denom) < 1e-12) {
        return 0.0;
    }
    return (n * sum_xy - sum_x * sum_y) / denom;
}

double correlationDimension(std::span<Vec3 const> samples) {
    std::vector<double> log_sizes;
    std::vector<double> log_counts;

    for (double size : CORRELATION_SCALES) {
        std::unordered_set<uint64_t> boxes;
        for (Vec3 const& p : samples) {
            boxes.insert(boxKey(p, size));
        }
        if (!boxes.empty()) {
            log_sizes.push_back(std::log(size));
            log_counts.push_back(std::log(static_cast<double>(boxes.size())));
        }
    }

    return 0.0 - regressionSlope(log_sizes, log_counts);
}

double informationDimension(std::span<Vec3 const> samples) {
    std::vector<double> log_sizes;
    std::vector<double> entropies;
    double n = static_cast<double>(samples.size());

    for (double size : INFORMATION_SCALES) {
        std::unordered_map<uint64_t, int> counts;
        for (Vec3 const& p : samples) {
            ++counts[boxKey(p, size)];
        }

        double entropy = 0.0;
        for (auto const& [key, count] : counts) {
            double p = count / n;
            entropy -= p * std::log2(p);
        }
        if (entropy > 0.0) {
            log_sizes.push_back(std::log2(size));
            entropies.push_back(entropy);
        }
    }

    return 0.0 - regressionSlope(log_sizes, entropies);
}

} // namespace field
