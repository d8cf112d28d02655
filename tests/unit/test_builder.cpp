/**
 * @file test_builder.cpp
 * @brief Unit tests for median splitting and OBB tree construction
 */

#include <gtest/gtest.h>
#include "obbcollide/bvh/builder.h"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace obbcollide;
using namespace obbcollide::bvh;
using geometry::Face;
using geometry::OBB;

// ============================================================================
// split_by_projection
// ============================================================================

class SplitTest : public ::testing::Test {
protected:
    static std::vector<Projected<int>> numbered(const std::vector<Real>& values) {
        std::vector<Projected<int>> items;
        for (SizeT i = 0; i < values.size(); ++i) {
            items.push_back({static_cast<int>(i), values[i]});
        }
        return items;
    }
};

TEST_F(SplitTest, EvenCountSplitsInHalf) {
    auto split = split_by_projection(numbered({4.0, 1.0, 3.0, 2.0}));
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split->first, (std::vector<int>{1, 3}));
    EXPECT_EQ(split->second, (std::vector<int>{0, 2}));
}

TEST_F(SplitTest, OddCountPutsExtraFirst) {
    auto split = split_by_projection(numbered({5.0, 1.0, 4.0, 2.0, 3.0}));
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split->first, (std::vector<int>{1, 3, 4}));
    EXPECT_EQ(split->second, (std::vector<int>{0, 2}));
}

TEST_F(SplitTest, TiesStayWithMedian) {
    auto split = split_by_projection(numbered({1.0, 1.0, 2.0, 1.0, 1.0}));
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split->first, (std::vector<int>{0, 1, 3, 4}));
    EXPECT_EQ(split->second, (std::vector<int>{2}));
}

TEST_F(SplitTest, TiesAtTopMoveBoundaryDown) {
    auto split = split_by_projection(numbered({2.0, 2.0, 1.0, 2.0, 2.0}));
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split->first, (std::vector<int>{2}));
    EXPECT_EQ(split->second, (std::vector<int>{0, 1, 3, 4}));
}

TEST_F(SplitTest, NearlyEqualValuesAreTies) {
    auto split = split_by_projection(numbered({1.0, 1.0 + 1e-9, 3.0, 1.0 - 1e-9}));
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split->first, (std::vector<int>{0, 1, 3}));
    EXPECT_EQ(split->second, (std::vector<int>{2}));
}

TEST_F(SplitTest, AllTiedGivesNothing) {
    EXPECT_FALSE(split_by_projection(numbered({1.0, 1.0 + 1e-10, 1.0 - 1e-10})).has_value());
    EXPECT_FALSE(split_by_projection(numbered({7.0, 7.0})).has_value());
}

TEST_F(SplitTest, FewerThanTwoGivesNothing) {
    EXPECT_FALSE(split_by_projection(numbered({})).has_value());
    EXPECT_FALSE(split_by_projection(numbered({1.0})).has_value());
}

TEST_F(SplitTest, ChainOfNearTiesGivesNothing) {
    // Range exceeds epsilon but every value ties with the median
    auto items = numbered({0.0, 0.6e-6, 1.2e-6});
    EXPECT_FALSE(split_by_projection(items, 1e-6).has_value());
    EXPECT_TRUE(split_by_projection(items, 1e-7).has_value());
}

TEST_F(SplitTest, EpsilonIsConfigurable) {
    auto items = numbered({0.0, 0.05, 1.0, 1.05});
    auto coarse = split_by_projection(items, 0.1);
    ASSERT_TRUE(coarse.has_value());
    EXPECT_EQ(coarse->first, (std::vector<int>{0, 1}));

    EXPECT_FALSE(split_by_projection(items, 2.0).has_value());
}

TEST_F(SplitTest, PartitionKeepsEveryItem) {
    std::vector<Real> values{3.0, 9.0, 1.0, 1.0, 7.0, 3.0, 3.0, 8.0, 0.0};
    auto split = split_by_projection(numbered(values));
    ASSERT_TRUE(split.has_value());

    std::vector<int> all = split->first;
    all.insert(all.end(), split->second.begin(), split->second.end());
    std::sort(all.begin(), all.end());
    EXPECT_EQ(all, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8}));

    // Every first-half value lies below every second-half value
    Real first_max = -1e300;
    Real second_min = 1e300;
    for (int i : split->first) first_max = std::max(first_max, values[i]);
    for (int i : split->second) second_min = std::min(second_min, values[i]);
    EXPECT_LT(first_max, second_min);
}

// ============================================================================
// project_and_split
// ============================================================================

TEST(ProjectAndSplitTest, UsesCentroids) {
    std::vector<Face> faces{
        {{4, 0, 0}, {5, 0, 0}, {4, 1, 0}},
        {{0, 0, 0}, {1, 0, 0}, {0, 1, 0}},
        {{2, 0, 0}, {3, 0, 0}, {2, 1, 0}},
    };
    auto split = project_and_split(Vec3::UnitX(), faces);
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split->first, (std::vector<Face>{faces[1], faces[2]}));
    EXPECT_EQ(split->second, (std::vector<Face>{faces[0]}));

    // Along z every centroid ties
    EXPECT_FALSE(project_and_split(Vec3::UnitZ(), faces).has_value());
}

// ============================================================================
// build_tree
// ============================================================================

class BuildTreeTest : public ::testing::Test {
protected:
    // Row of small triangles spaced one unit apart along x
    static std::vector<Face> strip(SizeT count) {
        std::vector<Face> faces;
        for (SizeT i = 0; i < count; ++i) {
            Real x = static_cast<Real>(i);
            faces.push_back({{x, 0, 0}, {x + 0.5, 0, 0}, {x, 1, 0}});
        }
        return faces;
    }

    static std::vector<Face> leaves_of(const ObbTree& tree) {
        std::vector<Face> out;
        tree.for_each_leaf([&out](const Face& f) { out.push_back(f); });
        return out;
    }

    static bool encloses(const OBB& box, const Face& face, Real eps = 1e-9) {
        for (SizeT i = 0; i < 3; ++i) {
            Vec3 local = box.frame.from_reference(face.vertex(i));
            if (std::abs(local.x) > box.half_extents.x + eps ||
                std::abs(local.y) > box.half_extents.y + eps ||
                std::abs(local.z) > box.half_extents.z + eps) {
                return false;
            }
        }
        return true;
    }

    // Every internal box encloses every face below it
    static void expect_enclosing(const ObbTree& tree) {
        if (tree.is_leaf()) return;
        for (const auto& face : leaves_of(tree)) {
            EXPECT_TRUE(encloses(tree.node_payload(), face));
        }
        expect_enclosing(tree.left());
        expect_enclosing(tree.right());
    }

    static bool same_faces(std::vector<Face> a, std::vector<Face> b) {
        auto less = [](const Face& x, const Face& y) {
            auto key = [](const Face& f) {
                return std::vector<Real>{f.p.x, f.p.y, f.p.z, f.q.x, f.q.y, f.q.z,
                                         f.r.x, f.r.y, f.r.z};
            };
            return key(x) < key(y);
        };
        std::sort(a.begin(), a.end(), less);
        std::sort(b.begin(), b.end(), less);
        return a == b;
    }
};

TEST_F(BuildTreeTest, EmptyInputThrows) {
    EXPECT_THROW(build_tree({}), std::invalid_argument);
}

TEST_F(BuildTreeTest, SingleFaceIsLeaf) {
    auto faces = strip(1);
    ObbTree tree = build_tree(faces);
    ASSERT_TRUE(tree.is_leaf());
    EXPECT_EQ(tree.leaf_payload(), faces[0]);
}

TEST_F(BuildTreeTest, StripIsBalanced) {
    for (SizeT n : {2u, 3u, 5u, 8u, 16u, 17u}) {
        auto faces = strip(n);
        ObbTree tree = build_tree(faces);
        SizeT expected_depth = static_cast<SizeT>(std::ceil(std::log2(static_cast<Real>(n))));
        EXPECT_EQ(tree.leaf_count(), n);
        EXPECT_EQ(tree.size(), 2 * n - 1);
        EXPECT_EQ(tree.depth(), expected_depth) << n << " faces";
        EXPECT_EQ(tree.left().leaf_count(), (n + 1) / 2);
    }
}

TEST_F(BuildTreeTest, LeavesArePartitionOfInput) {
    auto faces = geometry::make_box_faces({3, 2, 1});
    ObbTree tree = build_tree(faces);
    EXPECT_EQ(tree.leaf_count(), faces.size());
    EXPECT_TRUE(same_faces(leaves_of(tree), faces));
    expect_enclosing(tree);
}

TEST_F(BuildTreeTest, AxisAlignedFitEnclosesToo) {
    BuildOptions options;
    options.fit_mode = geometry::FitMode::AxisAligned;
    auto faces = strip(9);
    for (auto& face : faces) {
        face = face.transformed(Frame{{1, 2, 3}, Quat::from_axis_angle(Vec3{1, 1, 0}, 0.7)});
    }
    ObbTree tree = build_tree(faces, options);
    EXPECT_TRUE(same_faces(leaves_of(tree), faces));
    expect_enclosing(tree);
    EXPECT_TRUE(tree.node_payload().frame.orientation == Quat::Identity());
}

TEST_F(BuildTreeTest, IdenticalFacesFallBackToPosition) {
    // No axis separates copies of one face; construction still terminates
    Face f{{0, 0, 0}, {1, 0, 0}, {0, 1, 0}};
    std::vector<Face> faces(5, f);
    ObbTree tree = build_tree(faces);
    EXPECT_EQ(tree.leaf_count(), 5u);
    EXPECT_EQ(tree.depth(), 3u);
    EXPECT_EQ(tree.left().leaf_count(), 3u);
}

TEST_F(BuildTreeTest, DeterministicForSameInput) {
    auto faces = geometry::make_box_faces({1, 4, 2});
    EXPECT_EQ(build_tree(faces), build_tree(faces));
}
