#pragma once
/**
 * @file frame.h
 * @brief Rigid transform (position + orientation)
 */

#include "obbcollide/core/types.h"

namespace obbcollide {

/**
 * @brief Rigid frame mapping local coordinates into a reference space
 *
 * A point p expressed in the frame maps to `position + orientation.rotate(p)`
 * in the reference space. Composition follows function application:
 * `(a * b).to_reference(p) == a.to_reference(b.to_reference(p))`.
 */
struct Frame {
    Vec3 position{};
    Quat orientation{};

    constexpr Frame() noexcept = default;
    constexpr Frame(const Vec3& position_, const Quat& orientation_) noexcept
        : position(position_), orientation(orientation_) {}

    static constexpr Frame Identity() noexcept { return {}; }

    /**
     * @brief Frame composition, `other` nested inside `*this`
     */
    Frame operator*(const Frame& other) const noexcept;

    /**
     * @brief Apply @p motion expressed in this frame's own local axes
     *
     * Equivalent to `*this * motion`.
     */
    Frame intrinsic(const Frame& motion) const noexcept;

    /**
     * @brief Apply @p motion expressed in the reference space
     *
     * Equivalent to `motion * *this`.
     */
    Frame extrinsic(const Frame& motion) const noexcept;

    Frame inverse() const noexcept;

    Vec3 to_reference(const Vec3& point) const noexcept;
    Vec3 to_reference_direction(const Vec3& direction) const noexcept;
    Vec3 from_reference(const Vec3& point) const noexcept;
    Vec3 from_reference_direction(const Vec3& direction) const noexcept;

    // Moves in the reference space
    Frame translated(const Vec3& offset) const noexcept;
    Frame rotated(const Quat& rotation) const noexcept;

    constexpr bool operator==(const Frame& other) const noexcept {
        return position == other.position && orientation == other.orientation;
    }
    constexpr bool operator!=(const Frame& other) const noexcept {
        return !(*this == other);
    }
};

namespace math {

bool are_nearly_equal(const Frame& a, const Frame& b, Real epsilon);

} // namespace math

} // namespace obbcollide
