#pragma once

#include "vec3.h"

#include <array>

namespace field {

enum class CriticalPointType { Saddle, StableNode, UnstableNode, Focus };

struct EigenDecomposition {
    std::array<double, 3> values{}; // Sorted descending; real parts for complex pairs
    std::array<Vec3, 3> vectors{};  // Unit-norm approximations, matching values
};

// Real roots of a*x^3 + b*x^2 + c*x + d = 0 in closed form (Cardano /
// trigonometric), sorted descending. A complex-conjugate pair is reported by
// its real part twice.
std::array<double, 3> solveCubic(double a, double b, double c, double d);

// Eigenvalues of a 3x3 matrix via its characteristic polynomial
std::array<double, 3> eigenvalues(Mat3 const& m);

// Best of a fixed set of candidate directions for (m - lambda*I) v = 0, normalized
Vec3 approximateEigenvector(Mat3 const& m, double lambda);

EigenDecomposition decompose(Mat3 const& m);

// Mixed signs -> saddle, all negative -> stable node, all positive -> unstable node,
// anything else (a zero eigenvalue) -> focus
CriticalPointType classify(std::array<double, 3> const& values);

} // namespace field
