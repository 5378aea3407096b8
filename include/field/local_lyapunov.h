#pragma once

#include "field/grid.h"
#include "thomas_system.h"

namespace field {

struct LocalLyapunovParams {
    double dt = 0.01;
    int iterations = 200;
    double escape_bound = 50.0; // Probe stops once any coordinate exceeds this
};

// Finite-time expansion rate of a single tangent vector started at `start`.
// The tangent (1e-8, 0, 0) is pushed through I + dt*J along a forward Euler
// path, renormalized every step. Returns log-growth per unit time over the
// valid steps, or 0 when none were taken.
double localLyapunov(ThomasSystem const& system, Vec3 const& start,
                     LocalLyapunovParams const& params);

ScalarGrid localLyapunovGrid(GridGeometry const& grid, ThomasSystem const& system,
                             LocalLyapunovParams const& params);

// Mean over the finite entries
double finiteMean(ScalarGrid const& values);

} // namespace field
