/**
 * @file test_math.cpp
 * @brief Unit tests for the obbcollide math library
 */

#include <gtest/gtest.h>
#include "obbcollide/core/types.h"
#include <cmath>

using namespace obbcollide;

// ============================================================================
// Vec3 Tests
// ============================================================================

class Vec3Test : public ::testing::Test {
protected:
    static constexpr Real EPSILON = 1e-10;

    bool nearly_equal(Real a, Real b, Real eps = EPSILON) {
        return std::abs(a - b) < eps;
    }

    bool nearly_equal(const Vec3& a, const Vec3& b, Real eps = EPSILON) {
        return nearly_equal(a.x, b.x, eps) &&
               nearly_equal(a.y, b.y, eps) &&
               nearly_equal(a.z, b.z, eps);
    }
};

TEST_F(Vec3Test, DefaultConstruction) {
    Vec3 v;
    EXPECT_EQ(v.x, 0.0);
    EXPECT_EQ(v.y, 0.0);
    EXPECT_EQ(v.z, 0.0);
}

TEST_F(Vec3Test, Arithmetic) {
    Vec3 a{1.0, 2.0, 3.0};
    Vec3 b{4.0, 5.0, 6.0};
    EXPECT_TRUE(nearly_equal(a + b, Vec3{5.0, 7.0, 9.0}));
    EXPECT_TRUE(nearly_equal(b - a, Vec3{3.0, 3.0, 3.0}));
    EXPECT_TRUE(nearly_equal(a * 2.0, Vec3{2.0, 4.0, 6.0}));
    EXPECT_TRUE(nearly_equal(2.0 * a, Vec3{2.0, 4.0, 6.0}));
    EXPECT_TRUE(nearly_equal(b / 2.0, Vec3{2.0, 2.5, 3.0}));
    EXPECT_TRUE(nearly_equal(-a, Vec3{-1.0, -2.0, -3.0}));
}

TEST_F(Vec3Test, DotProduct) {
    Vec3 a{1.0, 2.0, 3.0};
    Vec3 b{4.0, 5.0, 6.0};
    EXPECT_NEAR(a.dot(b), 32.0, EPSILON);  // 4 + 10 + 18

    // Perpendicular vectors
    EXPECT_NEAR(Vec3::UnitX().dot(Vec3::UnitY()), 0.0, EPSILON);
}

TEST_F(Vec3Test, CrossProduct) {
    EXPECT_TRUE(nearly_equal(Vec3::UnitX().cross(Vec3::UnitY()), Vec3::UnitZ()));
    EXPECT_TRUE(nearly_equal(Vec3::UnitY().cross(Vec3::UnitX()), -Vec3::UnitZ()));

    // Parallel vectors have a zero cross product
    Vec3 a{1.0, 2.0, 3.0};
    EXPECT_TRUE(nearly_equal(a.cross(a * 3.0), Vec3::Zero()));
}

TEST_F(Vec3Test, Length) {
    Vec3 v{3.0, 4.0, 0.0};
    EXPECT_NEAR(v.length_squared(), 25.0, EPSILON);
    EXPECT_NEAR(v.length(), 5.0, EPSILON);
    EXPECT_NEAR(math::distance(v, Vec3::Zero()), 5.0, EPSILON);
}

TEST_F(Vec3Test, Normalize) {
    Vec3 v{3.0, 4.0, 0.0};
    Vec3 n = v.normalized();
    EXPECT_NEAR(n.length(), 1.0, EPSILON);
    EXPECT_TRUE(nearly_equal(n, Vec3{0.6, 0.8, 0.0}));
}

TEST_F(Vec3Test, NormalizeZeroVector) {
    Vec3 n = Vec3::Zero().normalized();
    EXPECT_TRUE(nearly_equal(n, Vec3::Zero()));
}

TEST_F(Vec3Test, Indexing) {
    Vec3 v{1.0, 2.0, 3.0};
    EXPECT_EQ(v[0], 1.0);
    EXPECT_EQ(v[1], 2.0);
    EXPECT_EQ(v[2], 3.0);
}

TEST_F(Vec3Test, NearlyEqual) {
    Vec3 a{1.0, 1.0, 1.0};
    EXPECT_TRUE(math::are_nearly_equal(a, a + Vec3{1e-9, 0.0, 0.0}, 1e-6));
    EXPECT_FALSE(math::are_nearly_equal(a, a + Vec3{1e-3, 0.0, 0.0}, 1e-6));
    EXPECT_TRUE(math::is_nearly_zero(Vec3{1e-9, -1e-9, 0.0}, 1e-6));
}

// ============================================================================
// Quaternion Tests
// ============================================================================

class QuatTest : public ::testing::Test {
protected:
    static constexpr Real EPSILON = 1e-10;
    static constexpr Real PI = constants::PI;

    bool nearly_equal(const Vec3& a, const Vec3& b, Real eps = EPSILON) {
        return math::are_nearly_equal(a, b, eps);
    }
};

TEST_F(QuatTest, DefaultIsIdentity) {
    Quat q;
    EXPECT_EQ(q, Quat::Identity());
    EXPECT_EQ(q.w, 1.0);
}

TEST_F(QuatTest, FromAxisAngle) {
    // 90 degree rotation around Z axis
    Quat q = Quat::from_axis_angle(Vec3::UnitZ(), PI / 2);
    EXPECT_NEAR(q.w, std::cos(PI / 4), EPSILON);
    EXPECT_NEAR(q.x, 0.0, EPSILON);
    EXPECT_NEAR(q.y, 0.0, EPSILON);
    EXPECT_NEAR(q.z, std::sin(PI / 4), EPSILON);
}

TEST_F(QuatTest, RotateVector) {
    Quat q = Quat::from_axis_angle(Vec3::UnitZ(), PI / 2);
    EXPECT_TRUE(nearly_equal(q.rotate(Vec3::UnitX()), Vec3::UnitY(), 1e-9));

    Quat half_turn = Quat::from_axis_angle(Vec3::UnitZ(), PI);
    EXPECT_TRUE(nearly_equal(half_turn.rotate(Vec3::UnitX()), -Vec3::UnitX(), 1e-9));
}

TEST_F(QuatTest, MultiplicationComposesRotations) {
    Quat a = Quat::from_axis_angle(Vec3::UnitX(), PI / 2);
    Quat b = Quat::from_axis_angle(Vec3::UnitY(), PI / 2);
    Vec3 v{1.0, 2.0, 3.0};

    // (a * b) rotates by b first, then by a
    EXPECT_TRUE(nearly_equal((a * b).rotate(v), a.rotate(b.rotate(v)), 1e-9));

    // Not commutative
    EXPECT_FALSE(math::are_nearly_equal(a * b, b * a, 1e-6));
}

TEST_F(QuatTest, Inverse) {
    Quat q = Quat::from_axis_angle(Vec3{1.0, 1.0, 0.0}, PI / 3);
    EXPECT_TRUE(math::are_nearly_equal(q * q.inverse(), Quat::Identity(), 1e-9));
}

TEST_F(QuatTest, SignInsensitiveComparison) {
    Quat q = Quat::from_axis_angle(Vec3::UnitY(), 0.7);
    Quat neg{-q.w, -q.x, -q.y, -q.z};
    EXPECT_TRUE(math::are_nearly_equal(q, neg, 1e-12));
    EXPECT_NEAR(math::angle_between(q, neg), 0.0, 1e-6);
}

TEST_F(QuatTest, RotationMatrixRoundTrip) {
    Quat q = Quat::from_axis_angle(Vec3{0.3, -0.5, 0.8}, 2.1);
    Mat3x3 m = q.to_rotation_matrix();
    EXPECT_TRUE(math::is_orthogonal(m, 1e-9));
    EXPECT_NEAR(m.determinant(), 1.0, 1e-9);

    Quat back = Quat::from_rotation_matrix(m);
    EXPECT_TRUE(math::are_nearly_equal(q, back, 1e-9));
}

TEST_F(QuatTest, FromRotationMatrixHalfTurns) {
    // Trace -1 matrices take the non-w branches
    for (const Vec3& axis : {Vec3::UnitX(), Vec3::UnitY(), Vec3::UnitZ()}) {
        Quat q = Quat::from_axis_angle(axis, PI);
        Quat back = Quat::from_rotation_matrix(q.to_rotation_matrix());
        EXPECT_TRUE(math::are_nearly_equal(q, back, 1e-9));
    }
}

// ============================================================================
// Mat3x3 Tests
// ============================================================================

class Mat3x3Test : public ::testing::Test {
protected:
    static constexpr Real EPSILON = 1e-10;

    bool nearly_equal_mat(const Mat3x3& a, const Mat3x3& b, Real eps = EPSILON) {
        for (SizeT i = 0; i < 9; ++i) {
            if (std::abs(a.m[i] - b.m[i]) >= eps) return false;
        }
        return true;
    }

    static Mat3x3 diagonal(Real a, Real b, Real c) {
        Mat3x3 m = Mat3x3::Zero();
        m(0, 0) = a;
        m(1, 1) = b;
        m(2, 2) = c;
        return m;
    }
};

TEST_F(Mat3x3Test, DefaultIsIdentity) {
    Mat3x3 m;
    EXPECT_TRUE(nearly_equal_mat(m, Mat3x3::Identity()));
    EXPECT_NEAR(math::trace(m), 3.0, EPSILON);
}

TEST_F(Mat3x3Test, FromColumns) {
    Mat3x3 m = Mat3x3::FromColumns({1, 2, 3}, {4, 5, 6}, {7, 8, 9});
    EXPECT_EQ(m(0, 1), 4.0);
    EXPECT_EQ(m(2, 0), 3.0);
    EXPECT_EQ(m.column(2), (Vec3{7, 8, 9}));
}

TEST_F(Mat3x3Test, MultiplyAndTranspose) {
    Mat3x3 m = Mat3x3::FromColumns({1, 2, 3}, {4, 5, 6}, {7, 8, 10});
    Vec3 v{1.0, 0.0, 0.0};
    EXPECT_EQ(m * v, (Vec3{1, 2, 3}));
    EXPECT_TRUE(nearly_equal_mat(m * Mat3x3::Identity(), m));
    EXPECT_TRUE(nearly_equal_mat(m.transpose().transpose(), m));
    EXPECT_EQ(m.transpose()(0, 1), 2.0);
}

TEST_F(Mat3x3Test, Determinant) {
    EXPECT_NEAR(diagonal(2.0, 3.0, 4.0).determinant(), 24.0, EPSILON);
    EXPECT_NEAR(Mat3x3::FromColumns({1, 2, 3}, {2, 4, 6}, {0, 0, 1}).determinant(), 0.0, EPSILON);
}

TEST_F(Mat3x3Test, EigenOfDiagonal) {
    Mat3x3 vectors;
    Vec3 values;
    ASSERT_TRUE(math::symmetric_eigen(diagonal(5.0, 2.0, 9.0), vectors, values));
    EXPECT_NEAR(values.x, 5.0, EPSILON);
    EXPECT_NEAR(values.y, 2.0, EPSILON);
    EXPECT_NEAR(values.z, 9.0, EPSILON);
    EXPECT_TRUE(math::is_orthogonal(vectors, 1e-9));
}

TEST_F(Mat3x3Test, EigenOfRotatedDiagonal) {
    // R D R^T has eigenvalues D and eigenvectors the columns of R
    Mat3x3 r = Quat::from_axis_angle(Vec3{1.0, 2.0, 3.0}, 0.9).to_rotation_matrix();
    Mat3x3 s = r * diagonal(1.0, 4.0, 16.0) * r.transpose();
    ASSERT_TRUE(math::is_symmetric(s, 1e-9));

    Mat3x3 vectors;
    Vec3 values;
    ASSERT_TRUE(math::symmetric_eigen(s, vectors, values));
    EXPECT_TRUE(math::is_orthogonal(vectors, 1e-9));
    EXPECT_NEAR(vectors.determinant(), 1.0, 1e-9);

    for (SizeT i = 0; i < 3; ++i) {
        Vec3 v = vectors.column(i);
        // S v = lambda v
        EXPECT_TRUE(math::are_nearly_equal(s * v, v * values[i], 1e-8));
    }
    EXPECT_NEAR(values.x + values.y + values.z, 21.0, 1e-9);
}
