/**
 * @file matrix.cpp
 * @brief Matrix math implementation
 */

#include "obbcollide/core/types.h"
#include <cmath>
#include <utility>

namespace obbcollide {

namespace math {

namespace {

constexpr int JACOBI_MAX_SWEEPS = 50;
constexpr Real JACOBI_EPSILON = 1e-12;

// Apply the Jacobi rotation that zeroes a(p, q) to the working matrix and
// accumulate it into the eigenvector columns.
void jacobi_rotate(Mat3x3& a, Mat3x3& v, SizeT p, SizeT q) {
    Real apq = a(p, q);
    Real theta = (a(q, q) - a(p, p)) / (2.0 * apq);
    Real t = (theta >= 0.0 ? 1.0 : -1.0) /
             (std::abs(theta) + std::sqrt(theta * theta + 1.0));
    Real c = 1.0 / std::sqrt(t * t + 1.0);
    Real s = t * c;

    for (SizeT k = 0; k < 3; ++k) {
        Real akp = a(k, p);
        Real akq = a(k, q);
        a(k, p) = c * akp - s * akq;
        a(k, q) = s * akp + c * akq;
    }
    for (SizeT k = 0; k < 3; ++k) {
        Real apk = a(p, k);
        Real aqk = a(q, k);
        a(p, k) = c * apk - s * aqk;
        a(q, k) = s * apk + c * aqk;
    }
    for (SizeT k = 0; k < 3; ++k) {
        Real vkp = v(k, p);
        Real vkq = v(k, q);
        v(k, p) = c * vkp - s * vkq;
        v(k, q) = s * vkp + c * vkq;
    }
}

} // anonymous namespace

Real trace(const Mat3x3& m) {
    return m(0, 0) + m(1, 1) + m(2, 2);
}

bool is_orthogonal(const Mat3x3& m, Real epsilon) {
    // A matrix is orthogonal if M * M^T = I
    Mat3x3 product = m * m.transpose();
    Mat3x3 identity = Mat3x3::Identity();

    for (SizeT i = 0; i < 9; ++i) {
        if (std::abs(product.m[i] - identity.m[i]) > epsilon) {
            return false;
        }
    }
    return true;
}

bool is_symmetric(const Mat3x3& m, Real epsilon) {
    return std::abs(m(0, 1) - m(1, 0)) < epsilon &&
           std::abs(m(0, 2) - m(2, 0)) < epsilon &&
           std::abs(m(1, 2) - m(2, 1)) < epsilon;
}

bool symmetric_eigen(const Mat3x3& symmetric, Mat3x3& vectors, Vec3& values) {
    Mat3x3 a = symmetric;
    vectors = Mat3x3::Identity();

    Real scale = std::abs(a(0, 0)) + std::abs(a(1, 1)) + std::abs(a(2, 2));
    bool converged = false;

    for (int sweep = 0; sweep < JACOBI_MAX_SWEEPS; ++sweep) {
        Real off = std::abs(a(0, 1)) + std::abs(a(0, 2)) + std::abs(a(1, 2));
        if (off <= JACOBI_EPSILON * (scale > 0.0 ? scale : 1.0)) {
            converged = true;
            break;
        }

        const std::pair<SizeT, SizeT> pairs[3] = {{0, 1}, {0, 2}, {1, 2}};
        for (const auto& [p, q] : pairs) {
            if (a(p, q) != 0.0) {
                jacobi_rotate(a, vectors, p, q);
            }
        }
    }

    values = Vec3{a(0, 0), a(1, 1), a(2, 2)};

    // Keep the basis right-handed so it converts to a proper rotation
    if (vectors.determinant() < 0.0) {
        for (SizeT k = 0; k < 3; ++k) {
            vectors(k, 2) = -vectors(k, 2);
        }
    }

    return converged;
}

} // namespace math

} // namespace obbcollide
