#pragma once

#include "vec3.h"

#include <cmath>

// Thomas' cyclically symmetric attractor:
//   dx/dt = sin(y) - b*x
//   dy/dt = sin(z) - b*y
//   dz/dt = sin(x) - b*z
// Stateless apart from the dissipation parameter b; callers thread the state.
class ThomasSystem {
public:
    ThomasSystem() : b_(0.19) {}
    explicit ThomasSystem(double b) : b_(b) {}

    double b() const { return b_; }

    Vec3 velocity(Vec3 const& s) const {
        return {std::sin(s[1]) - b_ * s[0], std::sin(s[2]) - b_ * s[1],
                std::sin(s[0]) - b_ * s[2]};
    }

    // RK4 integration step
    Vec3 step(Vec3 const& s, double dt) const {
        Vec3 k1 = velocity(s);
        Vec3 k2 = velocity(s + (dt / 2) * k1);
        Vec3 k3 = velocity(s + (dt / 2) * k2);
        Vec3 k4 = velocity(s + dt * k3);
        return s + (dt / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
    }

    // Forward Euler step, used by the short local-expansion probes
    Vec3 eulerStep(Vec3 const& s, double dt) const { return s + dt * velocity(s); }

    // d(velocity)/d(state): cosines on the cyclic off-diagonal, -b on the diagonal
    Mat3 jacobian(Vec3 const& s) const {
        return {{{-b_, std::cos(s[1]), 0.0},
                 {0.0, -b_, std::cos(s[2])},
                 {std::cos(s[0]), 0.0, -b_}}};
    }

    // Trace of the Jacobian; phase-space volumes contract at this constant rate
    double divergence() const { return -3.0 * b_; }

    // Advance a state together with tangent vectors through one RK4 step.
    // Each tangent follows the linearized flow evaluated at the RK4 stage points,
    // so the log-volume growth of the tangent frame tracks divergence() * dt.
    template <size_t N>
    Vec3 stepWithTangents(Vec3 const& s, std::array<Vec3, N>& tangents, double dt) const {
        Vec3 k1 = velocity(s);
        Vec3 s2 = s + (dt / 2) * k1;
        Vec3 k2 = velocity(s2);
        Vec3 s3 = s + (dt / 2) * k2;
        Vec3 k3 = velocity(s3);
        Vec3 s4 = s + dt * k3;
        Vec3 k4 = velocity(s4);

        Mat3 j1 = jacobian(s);
        Mat3 j2 = jacobian(s2);
        Mat3 j3 = jacobian(s3);
        Mat3 j4 = jacobian(s4);

        for (auto& q : tangents) {
            Vec3 l1 = j1 * q;
            Vec3 l2 = j2 * (q + (dt / 2) * l1);
            Vec3 l3 = j3 * (q + (dt / 2) * l2);
            Vec3 l4 = j4 * (q + dt * l3);
            q = q + (dt / 6.0) * (l1 + 2.0 * l2 + 2.0 * l3 + l4);
        }

        return s + (dt / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
    }

private:
    double b_;
};
