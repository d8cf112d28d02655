#pragma once
/**
 * @file overlap.h
 * @brief Separating-axis overlap tests between boxes and triangles
 *
 * Both arguments of every test must be expressed in one common frame.
 * Two convex shapes are disjoint iff some axis exists on which their
 * projections do not overlap. Each test walks a fixed list of candidate
 * axes and reports overlap when none of them separates.
 *
 * Projections closer than `epsilon` (scaled by the axis length) count as
 * overlapping, so exactly touching shapes classify as overlapping. Axes
 * whose length is negligible relative to their factors (parallel edges,
 * degenerate triangles) are skipped.
 */

#include "obbcollide/geometry/face.h"
#include "obbcollide/geometry/obb.h"

namespace obbcollide::geometry {

/// Default absolute tolerance for projection interval comparisons
constexpr Real OVERLAP_EPSILON = 1e-6;

/**
 * @brief Box vs box, 15 axes
 *
 * The 3 face normals of each box and the 9 cross products of their axes.
 */
bool box_box(const OBB& a, const OBB& b, Real epsilon = OVERLAP_EPSILON);

/**
 * @brief Box vs triangle, 13 axes
 *
 * The 3 box axes, the triangle normal and the 9 cross products of the
 * triangle edges with the box axes.
 */
bool box_triangle(const OBB& box, const Face& face, Real epsilon = OVERLAP_EPSILON);

/**
 * @brief Triangle vs box, same test as box_triangle with swapped arguments
 */
bool triangle_box(const Face& face, const OBB& box, Real epsilon = OVERLAP_EPSILON);

/**
 * @brief Triangle vs triangle
 *
 * Both face normals and the 9 edge-pair cross products. When the normals
 * are parallel the edge crosses all collapse onto the normal, so the 6
 * in-plane edge normals are tested as well.
 */
bool triangle_triangle(const Face& a, const Face& b, Real epsilon = OVERLAP_EPSILON);

} // namespace obbcollide::geometry
