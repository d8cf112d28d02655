#pragma once
/**
 * @file types.h
 * @brief Scalar aliases and the small value types shared by every module
 *
 * Vec3, Quat and Mat3x3 are plain aggregates. Everything that needs a
 * square root or a trigonometric call lives in src/core/math.
 */

#include <cstdint>
#include <cstddef>

namespace obbcollide {

// ============================================================================
// Scalars
// ============================================================================

/**
 * @brief Coordinate type for vertices, frames and box extents
 *
 * Trees are serialized with 17 significant digits so that a decoded
 * tree compares equal to the one that was written.
 */
using Real = double;

using UInt32 = std::uint32_t;
using SizeT  = std::size_t;

struct Vec3;
struct Quat;
struct Mat3x3;

// ============================================================================
// Vec3
// ============================================================================

/**
 * @brief Point or direction in 3D
 */
struct Vec3 {
    Real x{0.0};
    Real y{0.0};
    Real z{0.0};

    constexpr Vec3() noexcept = default;
    constexpr Vec3(Real x_, Real y_, Real z_) noexcept : x(x_), y(y_), z(z_) {}

    static constexpr Vec3 Zero() noexcept { return {}; }
    static constexpr Vec3 UnitX() noexcept { return {1.0, 0.0, 0.0}; }
    static constexpr Vec3 UnitY() noexcept { return {0.0, 1.0, 0.0}; }
    static constexpr Vec3 UnitZ() noexcept { return {0.0, 0.0, 1.0}; }

    constexpr Vec3 operator-() const noexcept { return {-x, -y, -z}; }

    constexpr Vec3 operator+(const Vec3& v) const noexcept { return {x + v.x, y + v.y, z + v.z}; }
    constexpr Vec3 operator-(const Vec3& v) const noexcept { return {x - v.x, y - v.y, z - v.z}; }
    constexpr Vec3 operator*(Real s) const noexcept { return {x * s, y * s, z * s}; }
    constexpr Vec3 operator/(Real s) const noexcept { return {x / s, y / s, z / s}; }
    friend constexpr Vec3 operator*(Real s, const Vec3& v) noexcept { return v * s; }

    constexpr Vec3& operator+=(const Vec3& v) noexcept { return *this = *this + v; }
    constexpr Vec3& operator-=(const Vec3& v) noexcept { return *this = *this - v; }
    constexpr Vec3& operator*=(Real s) noexcept { return *this = *this * s; }

    /// Axis component: 0 is x, 1 is y, anything else is z
    constexpr Real operator[](SizeT axis) const noexcept {
        return axis == 0 ? x : axis == 1 ? y : z;
    }

    constexpr Real dot(const Vec3& v) const noexcept { return x * v.x + y * v.y + z * v.z; }

    constexpr Vec3 cross(const Vec3& v) const noexcept {
        return {y * v.z - z * v.y, z * v.x - x * v.z, x * v.y - y * v.x};
    }

    constexpr Real length_squared() const noexcept { return dot(*this); }

    Real length() const noexcept;

    /// Unit vector along this one; a (near) zero vector is returned unchanged
    Vec3 normalized() const noexcept;

    // Exact comparison. Tree equality and serialization round trips rely on it.
    constexpr bool operator==(const Vec3& v) const noexcept {
        return x == v.x && y == v.y && z == v.z;
    }
    constexpr bool operator!=(const Vec3& v) const noexcept { return !(*this == v); }
};

// ============================================================================
// Quat
// ============================================================================

/**
 * @brief Rotation as a Hamilton quaternion w + xi + yj + zk
 *
 * Frames store unit quaternions. rotate() maps a local direction into
 * the reference space, and q and -q describe the same rotation.
 */
struct Quat {
    Real w{1.0};
    Real x{0.0};
    Real y{0.0};
    Real z{0.0};

    constexpr Quat() noexcept = default;
    constexpr Quat(Real w_, Real x_, Real y_, Real z_) noexcept
        : w(w_), x(x_), y(y_), z(z_) {}

    static constexpr Quat Identity() noexcept { return {}; }

    /// Rotation by @p angle radians about @p axis (any length but zero)
    static Quat from_axis_angle(const Vec3& axis, Real angle) noexcept;

    /// Quaternion for a proper rotation matrix (determinant +1)
    static Quat from_rotation_matrix(const Mat3x3& m) noexcept;

    /// Composition: (a * b).rotate(v) == a.rotate(b.rotate(v))
    constexpr Quat operator*(const Quat& q) const noexcept {
        return {
            w * q.w - x * q.x - y * q.y - z * q.z,
            w * q.x + x * q.w + y * q.z - z * q.y,
            w * q.y - x * q.z + y * q.w + z * q.x,
            w * q.z + x * q.y - y * q.x + z * q.w
        };
    }

    constexpr Quat conjugate() const noexcept { return {w, -x, -y, -z}; }
    constexpr Real norm_squared() const noexcept { return w * w + x * x + y * y + z * z; }

    Real norm() const noexcept;
    Quat normalized() const noexcept;
    Quat inverse() const noexcept;

    Vec3 rotate(const Vec3& v) const noexcept;

    /// Columns are the rotated unit axes
    Mat3x3 to_rotation_matrix() const noexcept;

    // Component-wise; q and -q compare unequal here (see math::are_nearly_equal)
    constexpr bool operator==(const Quat& q) const noexcept {
        return w == q.w && x == q.x && y == q.y && z == q.z;
    }
    constexpr bool operator!=(const Quat& q) const noexcept { return !(*this == q); }
};

// ============================================================================
// Mat3x3
// ============================================================================

/**
 * @brief Row-major 3x3 matrix, used for rotation bases and covariances
 */
struct Mat3x3 {
    Real m[9]{1, 0, 0, 0, 1, 0, 0, 0, 1};

    constexpr Mat3x3() noexcept = default;

    static constexpr Mat3x3 Identity() noexcept { return {}; }

    static constexpr Mat3x3 Zero() noexcept {
        Mat3x3 z;
        for (auto& v : z.m) v = 0.0;
        return z;
    }

    static constexpr Mat3x3 FromColumns(const Vec3& c0, const Vec3& c1, const Vec3& c2) noexcept {
        Mat3x3 r;
        for (SizeT i = 0; i < 3; ++i) {
            r(i, 0) = c0[i];
            r(i, 1) = c1[i];
            r(i, 2) = c2[i];
        }
        return r;
    }

    constexpr Real& operator()(SizeT row, SizeT col) noexcept { return m[row * 3 + col]; }
    constexpr Real operator()(SizeT row, SizeT col) const noexcept { return m[row * 3 + col]; }

    constexpr Vec3 column(SizeT col) const noexcept { return {m[col], m[3 + col], m[6 + col]}; }
    constexpr Vec3 row(SizeT r) const noexcept { return {m[3 * r], m[3 * r + 1], m[3 * r + 2]}; }

    constexpr Vec3 operator*(const Vec3& v) const noexcept {
        return {row(0).dot(v), row(1).dot(v), row(2).dot(v)};
    }

    constexpr Mat3x3 operator*(const Mat3x3& o) const noexcept {
        Mat3x3 r;
        for (SizeT i = 0; i < 3; ++i) {
            for (SizeT j = 0; j < 3; ++j) {
                r(i, j) = row(i).dot(o.column(j));
            }
        }
        return r;
    }

    constexpr Mat3x3 transpose() const noexcept {
        return FromColumns(row(0), row(1), row(2));
    }

    constexpr Real determinant() const noexcept {
        return row(0).dot(row(1).cross(row(2)));
    }
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {

constexpr Real PI = 3.14159265358979323846;
constexpr Real DEG_TO_RAD = PI / 180.0;

} // namespace constants

// ============================================================================
// Free Functions
// ============================================================================

namespace math {

Real distance(const Vec3& a, const Vec3& b);
bool is_nearly_zero(const Vec3& v, Real epsilon);
bool are_nearly_equal(const Vec3& a, const Vec3& b, Real epsilon);

/// Rotation angle in [0, pi] taking @p a to @p b
Real angle_between(const Quat& a, const Quat& b);

/// True when @p a and @p b are the same rotation (q and -q match)
bool are_nearly_equal(const Quat& a, const Quat& b, Real epsilon);

Real trace(const Mat3x3& m);
bool is_orthogonal(const Mat3x3& m, Real epsilon);
bool is_symmetric(const Mat3x3& m, Real epsilon);

/**
 * @brief Eigen-decomposition of a symmetric 3x3 matrix
 *
 * Cyclic Jacobi rotations. On return the columns of @p vectors are
 * orthonormal eigenvectors forming a right-handed basis, and @p values
 * holds the matching eigenvalues.
 *
 * @return false if the iteration limit was reached before the
 *         off-diagonal terms vanished (the result is still orthonormal)
 */
bool symmetric_eigen(const Mat3x3& symmetric, Mat3x3& vectors, Vec3& values);

} // namespace math

} // namespace obbcollide
