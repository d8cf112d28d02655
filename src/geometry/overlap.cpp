/**
 * @file overlap.cpp
 * @brief Separating-axis overlap tests
 */

#include "obbcollide/geometry/overlap.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace obbcollide::geometry {

namespace {

// Squared sine of the angle below which two directions count as parallel
constexpr Real PARALLEL_EPSILON_SQ = 1e-12;

struct Interval {
    Real min;
    Real max;
};

Interval project(const OBB& box, const Vec3& axis) {
    Real c = box.center().dot(axis);
    Real r = box.projection_radius(axis);
    return {c - r, c + r};
}

Interval project(const Face& face, const Vec3& axis) {
    Real a = face.p.dot(axis);
    Real b = face.q.dot(axis);
    Real c = face.r.dot(axis);
    return {std::min({a, b, c}), std::max({a, b, c})};
}

// Cross product of two candidate directions, or zero when they are
// (nearly) parallel or either one is degenerate.
Vec3 cross_axis(const Vec3& u, const Vec3& v) {
    Vec3 n = u.cross(v);
    Real scale = u.length_squared() * v.length_squared();
    if (scale <= 0.0 || n.length_squared() <= PARALLEL_EPSILON_SQ * scale) {
        return Vec3::Zero();
    }
    return n;
}

template <typename A, typename B>
bool separated_on(const A& a, const B& b, const Vec3& axis, Real epsilon) {
    Real len2 = axis.length_squared();
    if (len2 <= 0.0) {
        return false;  // No information along a null axis
    }
    Interval ia = project(a, axis);
    Interval ib = project(b, axis);
    Real tolerance = epsilon * std::sqrt(len2);
    return ia.min - ib.max > tolerance || ib.min - ia.max > tolerance;
}

} // anonymous namespace

bool box_box(const OBB& a, const OBB& b, Real epsilon) {
    const auto axes_a = a.axes();
    const auto axes_b = b.axes();

    for (const auto& axis : axes_a) {
        if (separated_on(a, b, axis, epsilon)) return false;
    }
    for (const auto& axis : axes_b) {
        if (separated_on(a, b, axis, epsilon)) return false;
    }
    for (const auto& u : axes_a) {
        for (const auto& v : axes_b) {
            if (separated_on(a, b, cross_axis(u, v), epsilon)) return false;
        }
    }
    return true;
}

bool box_triangle(const OBB& box, const Face& face, Real epsilon) {
    const auto axes = box.axes();

    for (const auto& axis : axes) {
        if (separated_on(box, face, axis, epsilon)) return false;
    }
    if (separated_on(box, face, face.normal(), epsilon)) return false;

    for (SizeT e = 0; e < 3; ++e) {
        const Vec3 edge = face.edge(e);
        for (const auto& axis : axes) {
            if (separated_on(box, face, cross_axis(edge, axis), epsilon)) return false;
        }
    }
    return true;
}

bool triangle_box(const Face& face, const OBB& box, Real epsilon) {
    return box_triangle(box, face, epsilon);
}

bool triangle_triangle(const Face& a, const Face& b, Real epsilon) {
    const Vec3 na = a.normal();
    const Vec3 nb = b.normal();

    if (separated_on(a, b, na, epsilon)) return false;
    if (separated_on(a, b, nb, epsilon)) return false;

    for (SizeT i = 0; i < 3; ++i) {
        const Vec3 ea = a.edge(i);
        for (SizeT j = 0; j < 3; ++j) {
            if (separated_on(a, b, cross_axis(ea, b.edge(j)), epsilon)) return false;
        }
    }

    // Coplanar pair: separate within the shared plane
    if (cross_axis(na, nb) == Vec3::Zero()) {
        for (SizeT i = 0; i < 3; ++i) {
            if (separated_on(a, b, cross_axis(na, a.edge(i)), epsilon)) return false;
            if (separated_on(a, b, cross_axis(nb, b.edge(i)), epsilon)) return false;
        }
    }
    return true;
}

} // namespace obbcollide::geometry
