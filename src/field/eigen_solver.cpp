#include "field/eigen_solver.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>

namespace field {

namespace {

constexpr double DEGENERACY_EPS = 1e-12;

std::array<double, 3> sortedDescending(std::array<double, 3> roots) {
    std::sort(roots.begin(), roots.end(), std::greater<>());
    return roots;
}

} // namespace

std::array<double, 3> solveCubic(double a, double b, double c, double d) {
    // Monic form x^3 + A x^2 + B x + C
    double A = b / a;
    double B = c / a;
    double C = d / a;

    // Depressed cubic t^3 + p t + q with x = t - A/3
    double shift = A / 3.0;
    double p = B - A * A / 3.0;
    double q = 2.0 * A * A * A / 27.0 - A * B / 3.0 + C;
    double disc = (q / 2.0) * (q / 2.0) + (p / 3.0) * (p / 3.0) * (p / 3.0);

    // Both tests are relative to the size of the terms they compare, so
    // closely spaced roots of small magnitude stay distinct
    double disc_scale = (q / 2.0) * (q / 2.0) + std::abs((p / 3.0) * (p / 3.0) * (p / 3.0));
    if (std::abs(disc) <= DEGENERACY_EPS * disc_scale) {
        if (std::abs(p) <= DEGENERACY_EPS * (A * A + std::abs(B))) {
            // Triple root
            double r = -shift;
            return {r, r, r};
        }
        // One simple and one double root
        double simple = 3.0 * q / p - shift;
        double twice = -3.0 * q / (2.0 * p) - shift;
        return sortedDescending({simple, twice, twice});
    }

    if (disc > 0.0) {
        // One real root and a complex-conjugate pair (real part kept)
        double sq = std::sqrt(disc);
        double u = std::cbrt(-q / 2.0 + sq);
        double v = std::cbrt(-q / 2.0 - sq);
        double real_root = u + v - shift;
        double pair_real = -(u + v) / 2.0 - shift;
        return sortedDescending({real_root, pair_real, pair_real});
    }

    // Three distinct real roots
    double m = 2.0 * std::sqrt(-p / 3.0);
    double arg = std::clamp(3.0 * q / (p * m), -1.0, 1.0);
    double theta = std::acos(arg) / 3.0;
    constexpr double TWO_PI_3 = 2.0 * M_PI / 3.0;
    return sortedDescending({m * std::cos(theta) - shift, m * std::cos(theta - TWO_PI_3) - shift,
                             m * std::cos(theta - 2.0 * TWO_PI_3) - shift});
}

std::array<double, 3> eigenvalues(Mat3 const& m) {
    // det(m - lambda*I) = -lambda^3 + tr*lambda^2 - minors*lambda + det
    double tr = trace(m);
    double minors = m[0][0] * m[1][1] - m[0][1] * m[1][0] + m[0][0] * m[2][2] -
                    m[0][2] * m[2][0] + m[1][1] * m[2][2] - m[1][2] * m[2][1];
    double det = determinant(m);
    return solveCubic(-1.0, tr, -minors, det);
}

Vec3 approximateEigenvector(Mat3 const& m, double lambda) {
    static constexpr std::array<Vec3, 7> CANDIDATES = {{{1.0, 0.0, 0.0},
                                                        {0.0, 1.0, 0.0},
                                                        {0.0, 0.0, 1.0},
                                                        {1.0, 1.0, 0.0},
                                                        {1.0, 0.0, 1.0},
                                                        {0.0, 1.0, 1.0},
                                                        {1.0, 1.0, 1.0}}};

    Mat3 shifted = m;
    for (int i = 0; i < 3; ++i) {
        shifted[i][i] -= lambda;
    }

    Vec3 best = CANDIDATES[0];
    double best_residual = std::numeric_limits<double>::infinity();
    for (Vec3 const& candidate : CANDIDATES) {
        Vec3 unit = (1.0 / norm(candidate)) * candidate;
        double residual = norm(shifted * unit);
        if (residual < best_residual) {
            best_residual = residual;
            best = unit;
        }
    }
    return best;
}

EigenDecomposition decompose(Mat3 const& m) {
    EigenDecomposition result;
    result.values = eigenvalues(m);
    for (size_t i = 0; i < 3; ++i) {
        result.vectors[i] = approximateEigenvector(m, result.values[i]);
    }
    return result;
}

CriticalPointType classify(std::array<double, 3> const& values) {
    int positive = 0;
    int negative = 0;
    for (double v : values) {
        if (v > 0.0) {
            ++positive;
        } else if (v < 0.0) {
            ++negative;
        }
    }
    if (positive > 0 && negative > 0) {
        return CriticalPointType::Saddle;
    }
    if (negative == 3) {
        return CriticalPointType::StableNode;
    }
    if (positive == 3) {
        return CriticalPointType::UnstableNode;
    }
    return CriticalPointType::Focus;
}

} // namespace field
