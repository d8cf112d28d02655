#pragma once
/**
 * @file obb.h
 * @brief Oriented bounding box
 */

#include "obbcollide/core/frame.h"
#include "obbcollide/geometry/face.h"

#include <array>
#include <vector>

namespace obbcollide::geometry {

/**
 * @brief Oriented bounding box
 *
 * Half-extents (a, b, c) along the local x, y and z axes of `frame`.
 * Within a tree the frame is expressed in the owning body's local space,
 * never relative to a parent node.
 */
struct OBB {
    Vec3 half_extents{};
    Frame frame{};

    constexpr OBB() noexcept = default;
    constexpr OBB(const Vec3& half_extents_, const Frame& frame_) noexcept
        : half_extents(half_extents_), frame(frame_) {}

    constexpr const Vec3& center() const noexcept { return frame.position; }

    /**
     * @brief Unit axis i (0, 1, 2) of the box in the frame's reference space
     */
    Vec3 axis(SizeT i) const noexcept;

    std::array<Vec3, 3> axes() const noexcept;
    std::array<Vec3, 8> corners() const noexcept;

    /**
     * @brief Half-length of the box's projection onto @p direction
     *
     * Scales with the length of @p direction.
     */
    Real projection_radius(const Vec3& direction) const noexcept;

    /**
     * @brief Box re-expressed through @p outer (frame nested inside it)
     */
    OBB transformed(const Frame& outer) const noexcept;

    Real volume() const noexcept {
        return 8.0 * half_extents.x * half_extents.y * half_extents.z;
    }

    constexpr bool operator==(const OBB& other) const noexcept {
        return half_extents == other.half_extents && frame == other.frame;
    }
    constexpr bool operator!=(const OBB& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Orientation policy for fitting a box around faces
 */
enum class FitMode : UInt32 {
    Principal,    ///< Axes along the principal directions of the vertex spread
    AxisAligned   ///< Axes along the body-local x, y and z axes
};

/**
 * @brief Fit a (near-)minimal oriented box around @p faces
 *
 * Principal mode takes the eigenvectors of the area-weighted covariance of
 * the face vertices. An empty face list gives a zero box at the origin.
 */
OBB fit_obb(const std::vector<Face>& faces, FitMode mode = FitMode::Principal);

} // namespace obbcollide::geometry
