#pragma once

#include <array>
#include <cmath>

// Small fixed-size linear algebra used throughout the core.
// Vectors are plain arrays so they can be stored densely in grids.
using Vec3 = std::array<double, 3>;
using Mat3 = std::array<Vec3, 3>; // Row-major: m[row][col]

inline Vec3 operator+(Vec3 const& a, Vec3 const& b) {
    return {a[0] + b[0], a[1] + b[1], a[2] + b[2]};
}

inline Vec3 operator-(Vec3 const& a, Vec3 const& b) {
    return {a[0] - b[0], a[1] - b[1], a[2] - b[2]};
}

inline Vec3 operator*(double s, Vec3 const& v) {
    return {s * v[0], s * v[1], s * v[2]};
}

inline Vec3& operator+=(Vec3& a, Vec3 const& b) {
    a[0] += b[0];
    a[1] += b[1];
    a[2] += b[2];
    return a;
}

inline double dot(Vec3 const& a, Vec3 const& b) {
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

inline double norm(Vec3 const& v) {
    return std::sqrt(dot(v, v));
}

inline double distance(Vec3 const& a, Vec3 const& b) {
    return norm(a - b);
}

inline bool isFinite(Vec3 const& v) {
    return std::isfinite(v[0]) && std::isfinite(v[1]) && std::isfinite(v[2]);
}

inline Vec3 cross(Vec3 const& a, Vec3 const& b) {
    return {a[1] * b[2] - a[2] * b[1], a[2] * b[0] - a[0] * b[2], a[0] * b[1] - a[1] * b[0]};
}

inline Vec3 operator*(Mat3 const& m, Vec3 const& v) {
    return {dot(m[0], v), dot(m[1], v), dot(m[2], v)};
}

inline double trace(Mat3 const& m) {
    return m[0][0] + m[1][1] + m[2][2];
}

inline double determinant(Mat3 const& m) {
    return m[0][0] * (m[1][1] * m[2][2] - m[1][2] * m[2][1]) -
           m[0][1] * (m[1][0] * m[2][2] - m[1][2] * m[2][0]) +
           m[0][2] * (m[1][0] * m[2][1] - m[1][1] * m[2][0]);
}

inline Mat3 diagonal(double a, double b, double c) {
    return {{{a, 0.0, 0.0}, {0.0, b, 0.0}, {0.0, 0.0, c}}};
}
