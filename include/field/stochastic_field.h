#pragma once

#include "config.h"
#include "field/grid.h"
#include "thomas_system.h"
#include "timed_cache.h"

#include <chrono>
#include <cstdint>
#include <vector>

namespace field {

// Cheap density stand-in at p: exp(-|p|^2 / 10) * exp(-div), where
// div = -sin(y) - sin(z) - b
double densityProxy(Vec3 const& p, double b);

// n points spread over a sphere of the given radius (golden-angle spiral)
std::vector<Vec3> fibonacciSphere(int n, double radius);

// Monte Carlo + radial-basis-function approximation of the density grid.
// Points are rejection-sampled against an importance map peaked on the
// attractor's toroidal support, scored with densityProxy, and condensed into
// a handful of Gaussian RBF weights. Grid fills go through a per-coarse-cell
// cache with fixed expiry.
class StochasticDensityField {
public:
    using Clock = std::chrono::steady_clock;

    StochasticDensityField(double half_range, AccelerationParams const& params);

    // Redraws samples and refits weights for the given system
    void fit(ThomasSystem const& system);

    // Parameter change: cached cells no longer apply
    void clearCache() { cache_.clear(); }

    double importance(Vec3 const& p) const;
    double evaluate(Vec3 const& p) const;

    // One RBF evaluation per coarse block of cache_block^3 cells; blocks
    // evaluated within the expiry interval are reused
    ScalarGrid fillGrid(GridGeometry const& grid, Clock::time_point now);
    ScalarGrid fillGrid(GridGeometry const& grid) { return fillGrid(grid, Clock::now()); }

    bool fitted() const { return fitted_; }
    std::vector<Vec3> const& samples() const { return samples_; }
    std::vector<Vec3> const& centers() const { return centers_; }
    std::vector<double> const& weights() const { return weights_; }
    size_t cacheSize() const { return cache_.size(); }
    size_t cacheHits() const { return cache_hits_; }

private:
    void buildImportanceMap();
    double basis(double distance_sq) const;

    double half_range_;
    AccelerationParams params_;

    std::vector<double> importance_map_;
    std::vector<Vec3> samples_;
    std::vector<Vec3> centers_;
    std::vector<double> weights_;
    bool fitted_ = false;

    TimedCache<uint64_t, double, Clock> cache_;
    size_t cache_hits_ = 0;
};

} // namespace field
