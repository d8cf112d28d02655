/**
 * @file obb.cpp
 * @brief Oriented bounding box implementation and fitting
 */

#include "obbcollide/geometry/obb.h"
#include "obbcollide/core/log.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace obbcollide::geometry {

namespace {

// Off-diagonal covariance below this (relative to the largest moment)
// is treated as already diagonal.
constexpr Real DIAGONAL_EPSILON = 1e-5;

Mat3x3 principal_axes(const std::vector<Face>& faces) {
    Real total_area = 0.0;
    for (const auto& face : faces) {
        total_area += face.area();
    }
    // Degenerate faces only: fall back to equally weighted vertices
    const bool uniform = total_area < 1e-12;

    // Second moments about the origin. For a face of area A and centroid m
    // the surface integral of x x^T is A/12 (9 m m^T + p p^T + q q^T + r r^T),
    // which does not depend on how a surface is cut into triangles.
    Vec3 mean = Vec3::Zero();
    Real weight_sum = 0.0;
    Real s11 = 0, s22 = 0, s33 = 0, s12 = 0, s13 = 0, s23 = 0;
    auto accumulate = [&](const Vec3& v, Real w) {
        s11 += w * v.x * v.x; s22 += w * v.y * v.y; s33 += w * v.z * v.z;
        s12 += w * v.x * v.y; s13 += w * v.x * v.z; s23 += w * v.y * v.z;
    };
    for (const auto& face : faces) {
        if (uniform) {
            for (SizeT i = 0; i < 3; ++i) {
                mean += face.vertex(i);
                accumulate(face.vertex(i), 1.0);
            }
            weight_sum += 3.0;
            continue;
        }
        Real area = face.area();
        Vec3 m = face.centroid();
        mean += m * area;
        weight_sum += area;
        accumulate(m, 9.0 * area / 12.0);
        for (SizeT i = 0; i < 3; ++i) {
            accumulate(face.vertex(i), area / 12.0);
        }
    }
    mean = mean / weight_sum;

    Real a11 = s11 / weight_sum - mean.x * mean.x;
    Real a22 = s22 / weight_sum - mean.y * mean.y;
    Real a33 = s33 / weight_sum - mean.z * mean.z;
    Real a12 = s12 / weight_sum - mean.x * mean.y;
    Real a13 = s13 / weight_sum - mean.x * mean.z;
    Real a23 = s23 / weight_sum - mean.y * mean.z;

    Real largest = std::max({a11, a22, a33});
    if (largest <= 0.0) {
        return Mat3x3::Identity();
    }
    a11 /= largest; a22 /= largest; a33 /= largest;
    a12 /= largest; a13 /= largest; a23 /= largest;

    if (std::abs(a12) < DIAGONAL_EPSILON &&
        std::abs(a13) < DIAGONAL_EPSILON &&
        std::abs(a23) < DIAGONAL_EPSILON) {
        return Mat3x3::Identity();
    }

    Mat3x3 covariance;
    covariance(0, 0) = a11; covariance(0, 1) = a12; covariance(0, 2) = a13;
    covariance(1, 0) = a12; covariance(1, 1) = a22; covariance(1, 2) = a23;
    covariance(2, 0) = a13; covariance(2, 1) = a23; covariance(2, 2) = a33;

    Mat3x3 vectors;
    Vec3 values;
    if (!math::symmetric_eigen(covariance, vectors, values)) {
        log::logger()->debug("fit_obb: Jacobi iteration limit reached for {} faces",
                             faces.size());
    }
    return vectors;
}

} // anonymous namespace

Vec3 OBB::axis(SizeT i) const noexcept {
    switch (i) {
        case 0: return frame.to_reference_direction(Vec3::UnitX());
        case 1: return frame.to_reference_direction(Vec3::UnitY());
        default: return frame.to_reference_direction(Vec3::UnitZ());
    }
}

std::array<Vec3, 3> OBB::axes() const noexcept {
    return {axis(0), axis(1), axis(2)};
}

std::array<Vec3, 8> OBB::corners() const noexcept {
    std::array<Vec3, 8> result;
    SizeT n = 0;
    for (int sz = -1; sz <= 1; sz += 2) {
        for (int sy = -1; sy <= 1; sy += 2) {
            for (int sx = -1; sx <= 1; sx += 2) {
                result[n++] = frame.to_reference(Vec3(sx * half_extents.x,
                                                      sy * half_extents.y,
                                                      sz * half_extents.z));
            }
        }
    }
    return result;
}

Real OBB::projection_radius(const Vec3& direction) const noexcept {
    return half_extents.x * std::abs(axis(0).dot(direction)) +
           half_extents.y * std::abs(axis(1).dot(direction)) +
           half_extents.z * std::abs(axis(2).dot(direction));
}

OBB OBB::transformed(const Frame& outer) const noexcept {
    return {half_extents, outer * frame};
}

OBB fit_obb(const std::vector<Face>& faces, FitMode mode) {
    if (faces.empty()) {
        return OBB{};
    }

    Quat orientation = (mode == FitMode::Principal)
        ? Quat::from_rotation_matrix(principal_axes(faces))
        : Quat::Identity();
    // Extents along the stored orientation's own axes
    Mat3x3 basis = orientation.to_rotation_matrix();
    const Vec3 axes[3] = {basis.column(0), basis.column(1), basis.column(2)};

    Vec3 lo(std::numeric_limits<Real>::max(),
            std::numeric_limits<Real>::max(),
            std::numeric_limits<Real>::max());
    Vec3 hi(std::numeric_limits<Real>::lowest(),
            std::numeric_limits<Real>::lowest(),
            std::numeric_limits<Real>::lowest());

    for (const auto& face : faces) {
        for (SizeT v = 0; v < 3; ++v) {
            const Vec3& point = face.vertex(v);
            Real px = axes[0].dot(point);
            Real py = axes[1].dot(point);
            Real pz = axes[2].dot(point);
            lo.x = std::min(lo.x, px); hi.x = std::max(hi.x, px);
            lo.y = std::min(lo.y, py); hi.y = std::max(hi.y, py);
            lo.z = std::min(lo.z, pz); hi.z = std::max(hi.z, pz);
        }
    }

    Vec3 mid = (lo + hi) * 0.5;
    Vec3 center = axes[0] * mid.x + axes[1] * mid.y + axes[2] * mid.z;

    return OBB{(hi - lo) * 0.5, Frame{center, orientation}};
}

} // namespace obbcollide::geometry
