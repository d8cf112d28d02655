#pragma once
/**
 * @file builder.h
 * @brief Balanced OBB tree construction by projected-median splitting
 */

#include "obbcollide/bvh/tree.h"
#include "obbcollide/geometry/face.h"
#include "obbcollide/geometry/obb.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

namespace obbcollide::bvh {

/// OBB tree over triangular faces, the tree every body carries
using ObbTree = Tree<geometry::OBB, geometry::Face>;

/// Projection values closer than this are the same value
constexpr Real SPLIT_EPSILON = 1e-6;

/**
 * @brief Item paired with its scalar projection along a split axis
 */
template <typename T>
struct Projected {
    T item;
    Real projection;
};

/**
 * @brief Two-way partition, each half in original input order
 */
template <typename T>
struct Split {
    std::vector<T> first;
    std::vector<T> second;
};

/**
 * @brief Median partition of items by projection value
 *
 * The boundary index is ceil(N / 2): for odd counts the first half gets the
 * extra item. Every item tied with the median value (within @p epsilon)
 * joins the first half together with all smaller values; larger values go
 * to the second half. If the tie group holds the largest value, the
 * boundary moves below it instead: smaller values first, the whole tie
 * group second. Ties are never separated and each half keeps the input
 * order.
 *
 * @return std::nullopt when the projections carry no separating
 *         information at this tolerance (all values tied)
 */
template <typename T>
std::optional<Split<T>> split_by_projection(const std::vector<Projected<T>>& items,
                                            Real epsilon = SPLIT_EPSILON) {
    if (items.size() < 2) {
        return std::nullopt;
    }

    std::vector<Real> sorted;
    sorted.reserve(items.size());
    for (const auto& it : items) {
        sorted.push_back(it.projection);
    }
    std::sort(sorted.begin(), sorted.end());

    if (sorted.back() - sorted.front() < epsilon) {
        return std::nullopt;
    }

    const SizeT boundary = (items.size() + 1) / 2;
    const Real median = sorted[boundary - 1];
    const bool ties_at_top = sorted.back() - median < epsilon;

    auto goes_first = [&](Real v) {
        bool tied = std::abs(v - median) < epsilon;
        if (ties_at_top) {
            return !tied && v < median;
        }
        return tied || v < median;
    };

    Split<T> split;
    for (const auto& it : items) {
        if (goes_first(it.projection)) {
            split.first.push_back(it.item);
        } else {
            split.second.push_back(it.item);
        }
    }

    // Chains of near-equal values can leave no clean boundary
    if (split.first.empty() || split.second.empty()) {
        return std::nullopt;
    }
    return split;
}

/**
 * @brief Split faces by projecting their centroids onto @p axis
 *
 * See split_by_projection for the partition rule.
 */
std::optional<Split<geometry::Face>> project_and_split(
    const Vec3& axis,
    const std::vector<geometry::Face>& faces,
    Real epsilon = SPLIT_EPSILON);

/**
 * @brief Tree construction settings
 */
struct BuildOptions {
    geometry::FitMode fit_mode{geometry::FitMode::Principal};
    Real split_epsilon{SPLIT_EPSILON};
};

/**
 * @brief Build a balanced OBB tree over @p faces
 *
 * Each internal node carries the box fitted around its subtree's faces.
 * The split axis is the first of that box's axes, longest first, along
 * which project_and_split separates the faces. When no axis separates
 * them the faces are split by position, first ceil(N / 2) faces first.
 *
 * @throws std::invalid_argument if @p faces is empty
 */
ObbTree build_tree(const std::vector<geometry::Face>& faces,
                   const BuildOptions& options = {});

} // namespace obbcollide::bvh
