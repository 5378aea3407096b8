#include "field/stochastic_field.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace field {

namespace {

constexpr double OUTSIDE_IMPORTANCE = 0.1;
constexpr int MAX_REJECTION_ATTEMPTS = 1000;

} // namespace

double densityProxy(Vec3 const& p, double b) {
    double potential = dot(p, p);
    double divergence = -std::sin(p[1]) - std::sin(p[2]) - b;
    return std::exp(-potential / 10.0) * std::exp(-divergence);
}

std::vector<Vec3> fibonacciSphere(int n, double radius) {
    std::vector<Vec3> points;
    points.reserve(n);
    double golden_angle = M_PI * (3.0 - std::sqrt(5.0));
    for (int i = 0; i < n; ++i) {
        double y = n > 1 ? 1.0 - 2.0 * (i + 0.5) / n : 0.0;
        double r = std::sqrt(std::max(0.0, 1.0 - y * y));
        double theta = golden_angle * i;
        points.push_back({radius * r * std::cos(theta), radius * y, radius * r * std::sin(theta)});
    }
    return points;
}

StochasticDensityField::StochasticDensityField(double half_range, AccelerationParams const& params)
    : half_range_(half_range), params_(params),
      cache_(std::chrono::duration_cast<Clock::duration>(
          std::chrono::milliseconds(params.cache_expiry_ms))) {
    if (!(half_range > 0.0) || params.importance_grid < 1 || params.cache_block < 1) {
        throw std::invalid_argument("StochasticDensityField: invalid geometry");
    }
    buildImportanceMap();
    centers_ = fibonacciSphere(params_.basis_functions, params_.rbf_radius);
    weights_.assign(centers_.size(), 0.0);
}

void StochasticDensityField::buildImportanceMap() {
    GridGeometry map{params_.importance_grid, half_range_};
    importance_map_.resize(map.cellCount());
    for (size_t idx = 0; idx < importance_map_.size(); ++idx) {
        Vec3 c = map.cellCenter(idx);
        double r = std::sqrt(c[0] * c[0] + c[1] * c[1]);
        double offset = std::abs(r - params_.torus_radius) + std::abs(c[2]);
        importance_map_[idx] = std::exp(-offset / params_.tube_radius);
    }
}

double StochasticDensityField::importance(Vec3 const& p) const {
    GridGeometry map{params_.importance_grid, half_range_};
    auto cell = map.cellOf(p);
    if (!cell) {
        return OUTSIDE_IMPORTANCE;
    }
    return importance_map_[map.index((*cell)[0], (*cell)[1], (*cell)[2])];
}

double StochasticDensityField::basis(double distance_sq) const {
    return std::exp(-distance_sq / (params_.rbf_width * params_.rbf_width));
}

void StochasticDensityField::fit(ThomasSystem const& system) {
    std::mt19937 rng(params_.seed);
    std::uniform_real_distribution<double> coord(-half_range_, half_range_);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    samples_.clear();
    samples_.reserve(params_.monte_carlo_samples);
    for (int s = 0; s < params_.monte_carlo_samples; ++s) {
        Vec3 candidate{};
        for (int attempt = 0; attempt < MAX_REJECTION_ATTEMPTS; ++attempt) {
            candidate = {coord(rng), coord(rng), coord(rng)};
            if (unit(rng) < importance(candidate)) {
                break;
            }
        }
        samples_.push_back(candidate);
    }

    size_t fit_count = std::min(samples_.size(), static_cast<size_t>(std::max(0, params_.fit_samples)));
    std::vector<double> proxy(fit_count);
    for (size_t j = 0; j < fit_count; ++j) {
        proxy[j] = densityProxy(samples_[j], system.b());
    }

    for (size_t i = 0; i < centers_.size(); ++i) {
        double weighted = 0.0;
        double total = 0.0;
        for (size_t j = 0; j < fit_count; ++j) {
            Vec3 d = samples_[j] - centers_[i];
            double phi = basis(dot(d, d));
            weighted += proxy[j] * phi;
            total += phi;
        }
        weights_[i] = total > 0.0 ? weighted / total : 0.0;
    }

    cache_.clear();
    fitted_ = true;
}

double StochasticDensityField::evaluate(Vec3 const& p) const {
    double value = 0.0;
    for (size_t i = 0; i < centers_.size(); ++i) {
        Vec3 d = p - centers_[i];
        value += weights_[i] * basis(dot(d, d));
    }
    return value;
}

ScalarGrid StochasticDensityField::fillGrid(GridGeometry const& grid, Clock::time_point now) {
    ScalarGrid result(grid.cellCount(), 0.0);
    int block = params_.cache_block;
    cache_.prune(now);
    for (size_t idx = 0; idx < result.size(); ++idx) {
        auto [i, j, k] = grid.coords(idx);
        uint64_t key = packCellKey(i / block, j / block, k / block);
        if (auto cached = cache_.get(key, now)) {
            result[idx] = *cached;
            ++cache_hits_;
            continue;
        }
        double value = evaluate(grid.cellCenter(idx));
        cache_.put(key, value, now);
        result[idx] = value;
    }
    return result;
}

} // namespace field
