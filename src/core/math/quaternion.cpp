/**
 * @file quaternion.cpp
 * @brief Quaternion construction, rotation and matrix conversion
 */

#include "obbcollide/core/types.h"
#include <algorithm>
#include <cmath>

namespace obbcollide {

namespace {

constexpr Real MIN_QUAT_NORM = 1e-10;

// Squared 4D distance between two quaternions' components
Real component_distance_squared(const Quat& a, const Quat& b) {
    const Real dw = a.w - b.w;
    const Real dx = a.x - b.x;
    const Real dy = a.y - b.y;
    const Real dz = a.z - b.z;
    return dw * dw + dx * dx + dy * dy + dz * dz;
}

} // anonymous namespace

Quat Quat::from_axis_angle(const Vec3& axis, Real angle) noexcept {
    const Vec3 n = axis.normalized() * std::sin(0.5 * angle);
    return {std::cos(0.5 * angle), n.x, n.y, n.z};
}

Quat Quat::from_rotation_matrix(const Mat3x3& m) noexcept {
    // Branch on the largest of w and the three diagonal-derived components
    // so the divisor s stays away from zero.
    const Real tr = m(0, 0) + m(1, 1) + m(2, 2);
    Quat q;

    if (tr > 0.0) {
        const Real s = 2.0 * std::sqrt(1.0 + tr);
        q = {0.25 * s,
             (m(2, 1) - m(1, 2)) / s,
             (m(0, 2) - m(2, 0)) / s,
             (m(1, 0) - m(0, 1)) / s};
    } else if (m(0, 0) >= m(1, 1) && m(0, 0) >= m(2, 2)) {
        const Real s = 2.0 * std::sqrt(1.0 + m(0, 0) - m(1, 1) - m(2, 2));
        q = {(m(2, 1) - m(1, 2)) / s,
             0.25 * s,
             (m(0, 1) + m(1, 0)) / s,
             (m(0, 2) + m(2, 0)) / s};
    } else if (m(1, 1) >= m(2, 2)) {
        const Real s = 2.0 * std::sqrt(1.0 + m(1, 1) - m(0, 0) - m(2, 2));
        q = {(m(0, 2) - m(2, 0)) / s,
             (m(0, 1) + m(1, 0)) / s,
             0.25 * s,
             (m(1, 2) + m(2, 1)) / s};
    } else {
        const Real s = 2.0 * std::sqrt(1.0 + m(2, 2) - m(0, 0) - m(1, 1));
        q = {(m(1, 0) - m(0, 1)) / s,
             (m(0, 2) + m(2, 0)) / s,
             (m(1, 2) + m(2, 1)) / s,
             0.25 * s};
    }
    return q.normalized();
}

Real Quat::norm() const noexcept {
    return std::sqrt(norm_squared());
}

Quat Quat::normalized() const noexcept {
    const Real n = norm();
    if (n <= MIN_QUAT_NORM) {
        return Identity();
    }
    return {w / n, x / n, y / n, z / n};
}

Quat Quat::inverse() const noexcept {
    const Real n2 = norm_squared();
    if (n2 <= MIN_QUAT_NORM) {
        return Identity();
    }
    const Quat c = conjugate();
    return {c.w / n2, c.x / n2, c.y / n2, c.z / n2};
}

Vec3 Quat::rotate(const Vec3& v) const noexcept {
    // v' = v + 2w (u x v) + 2 u x (u x v), with u the vector part
    const Vec3 u{x, y, z};
    const Vec3 t = u.cross(v) * 2.0;
    return v + t * w + u.cross(t);
}

Mat3x3 Quat::to_rotation_matrix() const noexcept {
    return Mat3x3::FromColumns(rotate(Vec3::UnitX()),
                               rotate(Vec3::UnitY()),
                               rotate(Vec3::UnitZ()));
}

namespace math {

Real angle_between(const Quat& a, const Quat& b) {
    const Real d = std::abs(a.w * b.w + a.x * b.x + a.y * b.y + a.z * b.z);
    return 2.0 * std::acos(std::min(1.0, d));
}

bool are_nearly_equal(const Quat& a, const Quat& b, Real epsilon) {
    const Quat neg_b{-b.w, -b.x, -b.y, -b.z};
    const Real d2 = std::min(component_distance_squared(a, b),
                             component_distance_squared(a, neg_b));
    return d2 < epsilon * epsilon;
}

} // namespace math

} // namespace obbcollide
