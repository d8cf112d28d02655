/**
 * @file frame.cpp
 * @brief Rigid frame implementation
 */

#include "obbcollide/core/frame.h"

namespace obbcollide {

Frame Frame::operator*(const Frame& other) const noexcept {
    return {
        position + orientation.rotate(other.position),
        (orientation * other.orientation).normalized()
    };
}

Frame Frame::intrinsic(const Frame& motion) const noexcept {
    return *this * motion;
}

Frame Frame::extrinsic(const Frame& motion) const noexcept {
    return motion * *this;
}

Frame Frame::inverse() const noexcept {
    Quat inv = orientation.conjugate();
    return {-inv.rotate(position), inv};
}

Vec3 Frame::to_reference(const Vec3& point) const noexcept {
    return position + orientation.rotate(point);
}

Vec3 Frame::to_reference_direction(const Vec3& direction) const noexcept {
    return orientation.rotate(direction);
}

Vec3 Frame::from_reference(const Vec3& point) const noexcept {
    return orientation.conjugate().rotate(point - position);
}

Vec3 Frame::from_reference_direction(const Vec3& direction) const noexcept {
    return orientation.conjugate().rotate(direction);
}

Frame Frame::translated(const Vec3& offset) const noexcept {
    return {position + offset, orientation};
}

Frame Frame::rotated(const Quat& rotation) const noexcept {
    return extrinsic(Frame{Vec3::Zero(), rotation});
}

namespace math {

bool are_nearly_equal(const Frame& a, const Frame& b, Real epsilon) {
    return are_nearly_equal(a.position, b.position, epsilon) &&
           are_nearly_equal(a.orientation, b.orientation, epsilon);
}

} // namespace math

} // namespace obbcollide
