/**
 * @file test_frame.cpp
 * @brief Unit tests for rigid frame composition
 */

#include <gtest/gtest.h>
#include "obbcollide/core/frame.h"

using namespace obbcollide;

class FrameTest : public ::testing::Test {
protected:
    static constexpr Real EPSILON = 1e-9;

    Frame a{{1.0, 2.0, 3.0}, Quat::from_axis_angle(Vec3::UnitZ(), 0.4)};
    Frame b{{-4.0, 0.5, 2.0}, Quat::from_axis_angle(Vec3{1.0, 1.0, 0.0}, 1.3)};
    Vec3 p{0.7, -1.1, 2.5};
};

TEST_F(FrameTest, IdentityLeavesPointsAlone) {
    EXPECT_EQ(Frame::Identity().to_reference(p), p);
    EXPECT_TRUE(math::are_nearly_equal(Frame::Identity() * a, a, EPSILON));
    EXPECT_TRUE(math::are_nearly_equal(a * Frame::Identity(), a, EPSILON));
}

TEST_F(FrameTest, CompositionFollowsApplication) {
    Vec3 composed = (a * b).to_reference(p);
    Vec3 nested = a.to_reference(b.to_reference(p));
    EXPECT_TRUE(math::are_nearly_equal(composed, nested, EPSILON));
}

TEST_F(FrameTest, InverseUndoes) {
    EXPECT_TRUE(math::are_nearly_equal(a * a.inverse(), Frame::Identity(), EPSILON));
    EXPECT_TRUE(math::are_nearly_equal(a.inverse() * a, Frame::Identity(), EPSILON));
    EXPECT_TRUE(math::are_nearly_equal(a.from_reference(a.to_reference(p)), p, EPSILON));
    EXPECT_TRUE(math::are_nearly_equal(a.inverse().to_reference(p), a.from_reference(p), EPSILON));
}

TEST_F(FrameTest, IntrinsicAndExtrinsic) {
    EXPECT_TRUE(math::are_nearly_equal(a.intrinsic(b), a * b, EPSILON));
    EXPECT_TRUE(math::are_nearly_equal(a.extrinsic(b), b * a, EPSILON));

    // Intrinsic translation moves along the frame's own axes
    Frame turned{Vec3::Zero(), Quat::from_axis_angle(Vec3::UnitZ(), constants::PI / 2)};
    Frame step{Vec3::UnitX(), Quat::Identity()};
    EXPECT_TRUE(math::are_nearly_equal(turned.intrinsic(step).position, Vec3::UnitY(), EPSILON));
    EXPECT_TRUE(math::are_nearly_equal(turned.extrinsic(step).position, Vec3::UnitX(), EPSILON));
}

TEST_F(FrameTest, DirectionsIgnorePosition) {
    Vec3 d = a.to_reference_direction(Vec3::UnitX());
    EXPECT_TRUE(math::are_nearly_equal(d, a.orientation.rotate(Vec3::UnitX()), EPSILON));
    EXPECT_TRUE(math::are_nearly_equal(a.from_reference_direction(d), Vec3::UnitX(), EPSILON));
}

TEST_F(FrameTest, TranslatedAndRotated) {
    Frame moved = a.translated({1.0, 0.0, 0.0});
    EXPECT_TRUE(math::are_nearly_equal(moved.position, Vec3{2.0, 2.0, 3.0}, EPSILON));
    EXPECT_EQ(moved.orientation, a.orientation);

    // Rotation about the reference origin swings the position too
    Quat quarter = Quat::from_axis_angle(Vec3::UnitZ(), constants::PI / 2);
    Frame swung = Frame{Vec3::UnitX(), Quat::Identity()}.rotated(quarter);
    EXPECT_TRUE(math::are_nearly_equal(swung.position, Vec3::UnitY(), EPSILON));
    EXPECT_TRUE(math::are_nearly_equal(swung.orientation, quarter, EPSILON));
}

TEST_F(FrameTest, ExactEquality) {
    Frame copy = a;
    EXPECT_EQ(copy, a);
    EXPECT_NE(a, b);
}
