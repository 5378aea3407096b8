#pragma once

#include "config.h"
#include "field/field_snapshot.h"
#include "field/spatial_hash.h"
#include "field/stochastic_field.h"
#include "thomas_system.h"
#include "trajectory_store.h"

#include <memory>
#include <span>

namespace field {

// Owns the analysis trajectory ring and produces FieldSnapshots.
// Each pass reads a copy of the ring taken at its start, builds a fresh
// snapshot and only then replaces the published one.
class SpatialFieldAnalyzer {
public:
    explicit SpatialFieldAnalyzer(Config const& config);

    // Appends positions (velocities from `system`, timestamps spaced dt and
    // ending at end_time) to the analysis ring
    void ingest(std::span<Vec3 const> positions, ThomasSystem const& system, double end_time,
                double dt);

    // Full pass over the current ring
    std::shared_ptr<FieldSnapshot const> analyze(ThomasSystem const& system, uint64_t epoch);

    // Last published snapshot (null before the first pass)
    std::shared_ptr<FieldSnapshot const> snapshot() const { return current_; }

    // Grids describe a parameter that is no longer current
    bool stale() const { return stale_; }
    void markStale();

    // Drops stored samples (seed reset)
    void clearSamples() { store_.clear(); }

    // Density path a pass over `samples` stored samples would take
    DensityMethod resolveDensityMethod(size_t samples) const;

    TrajectoryStore const& store() const { return store_; }
    GridGeometry const& geometry() const { return geometry_; }
    StochasticDensityField const& stochasticField() const { return stochastic_; }

private:
    GridGeometry geometry_;
    FieldParams field_params_;
    StreamlineParams streamline_params_;
    bool verbose_;

    TrajectoryStore store_;
    SpatialHash hash_;
    StochasticDensityField stochastic_;
    double stochastic_fit_b_ = -1.0;

    std::shared_ptr<FieldSnapshot const> current_;
    bool stale_ = false;
};

} // namespace field
