#pragma once

#include "field/grid.h"
#include "vec3.h"

#include <span>

namespace field {

// Box sizes for the box-counting estimators
inline constexpr std::array<double, 6> CORRELATION_SCALES = {0.1, 0.2, 0.5, 1.0, 2.0, 4.0};
inline constexpr std::array<double, 4> INFORMATION_SCALES = {0.1, 0.2, 0.5, 1.0};

// count / (total * cellVolume); samples outside the cube count toward the total only
ScalarGrid histogramDensity(GridGeometry const& grid, std::span<Vec3 const> samples);

// Isotropic Gaussian KDE at every cell center:
// sum exp(-d^2 / 2h^2) / ((2*pi)^1.5 * h^3 * n)
ScalarGrid kernelDensity(GridGeometry const& grid, std::span<Vec3 const> samples,
                         double bandwidth);

// Shannon entropy (bits) of the cell mass above the density floor
double shannonEntropy(ScalarGrid const& density, double min_density);

// Least-squares slope of y on x; 0 with fewer than 2 points or a zero denominator
double regressionSlope(std::span<double const> x, std::span<double const> y);

// -slope of log(occupied boxes) against log(box size)
double correlationDimension(std::span<Vec3 const> samples);

// -slope of box entropy (bits) against log2(box size); scales with zero entropy are skipped
double informationDimension(std::span<Vec3 const> samples);

} // namespace field
