#pragma once
/**
 * @file face.h
 * @brief Triangular face of a rigid body surface
 */

#include "obbcollide/core/frame.h"

#include <vector>

namespace obbcollide::geometry {

/**
 * @brief Flat triangle with vertices p, q, r
 *
 * Degenerate triangles (collinear or coincident vertices) are accepted.
 * Their normal is the zero vector.
 */
struct Face {
    Vec3 p{};
    Vec3 q{};
    Vec3 r{};

    constexpr Face() noexcept = default;
    constexpr Face(const Vec3& p_, const Vec3& q_, const Vec3& r_) noexcept
        : p(p_), q(q_), r(r_) {}

    constexpr const Vec3& vertex(SizeT i) const noexcept {
        return i == 0 ? p : (i == 1 ? q : r);
    }

    /**
     * @brief Edge i runs from vertex i to vertex (i + 1) % 3
     */
    constexpr Vec3 edge(SizeT i) const noexcept {
        return vertex((i + 1) % 3) - vertex(i);
    }

    /**
     * @brief Unnormalized normal (q - p) x (r - p), length is twice the area
     */
    constexpr Vec3 normal() const noexcept {
        return (q - p).cross(r - p);
    }

    constexpr Vec3 centroid() const noexcept {
        return (p + q + r) / 3.0;
    }

    Vec3 unit_normal() const noexcept;
    Real area() const noexcept;

    /**
     * @brief Face with every vertex mapped through @p frame
     */
    Face transformed(const Frame& frame) const noexcept;

    constexpr bool operator==(const Face& other) const noexcept {
        return p == other.p && q == other.q && r == other.r;
    }
    constexpr bool operator!=(const Face& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Twelve outward-wound triangles of a box centered at the origin
 */
std::vector<Face> make_box_faces(const Vec3& half_extents);

} // namespace obbcollide::geometry
