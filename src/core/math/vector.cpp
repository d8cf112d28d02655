/**
 * @file vector.cpp
 * @brief Vec3 length, normalization and comparisons
 */

#include "obbcollide/core/types.h"
#include <cmath>

namespace obbcollide {

namespace {

// Below this length a vector has no usable direction
constexpr Real MIN_NORMALIZABLE_LENGTH = 1e-10;

} // anonymous namespace

Real Vec3::length() const noexcept {
    return std::sqrt(length_squared());
}

Vec3 Vec3::normalized() const noexcept {
    const Real len = length();
    return len > MIN_NORMALIZABLE_LENGTH ? *this / len : *this;
}

namespace math {

Real distance(const Vec3& a, const Vec3& b) {
    return (b - a).length();
}

bool is_nearly_zero(const Vec3& v, Real epsilon) {
    return v.length_squared() < epsilon * epsilon;
}

bool are_nearly_equal(const Vec3& a, const Vec3& b, Real epsilon) {
    return is_nearly_zero(b - a, epsilon);
}

} // namespace math

} // namespace obbcollide
