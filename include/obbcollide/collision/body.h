#pragma once
/**
 * @file body.h
 * @brief Rigid triangulated bodies and the two-body intersection query
 */

#include "obbcollide/bvh/builder.h"
#include "obbcollide/bvh/traversal.h"
#include "obbcollide/core/frame.h"
#include "obbcollide/geometry/overlap.h"

#include <memory>
#include <vector>

namespace obbcollide::collision {

using bvh::ObbTree;

/**
 * @brief Body: world placement plus the OBB tree over its faces
 *
 * Bodies are values. Moving a body yields a new Body that shares the
 * same immutable tree, so queries on old and new values never interfere.
 */
class Body {
public:
    /**
     * @throws std::invalid_argument if @p bounds is null
     */
    Body(Frame frame, std::shared_ptr<const ObbTree> bounds);

    /**
     * @brief Build the tree for @p faces (given in body-local coordinates)
     *
     * @throws std::invalid_argument if @p faces is empty
     */
    static Body from_faces(const std::vector<geometry::Face>& faces,
                           const Frame& frame = Frame::Identity(),
                           const bvh::BuildOptions& options = {});

    const Frame& frame() const noexcept { return frame_; }
    const ObbTree& bounds() const noexcept { return *bounds_; }
    const std::shared_ptr<const ObbTree>& shared_bounds() const noexcept { return bounds_; }

    Body with_frame(const Frame& frame) const;

    /// Move by @p offset in world space
    Body translated(const Vec3& offset) const;

    /// Rotate about the body's own origin, @p rotation given in world axes
    Body rotated(const Quat& rotation) const;

private:
    Frame frame_;
    std::shared_ptr<const ObbTree> bounds_;
};

/**
 * @brief Geometric predicates for a pair of trees
 *
 * Payloads of the second tree are mapped through @p relative (second
 * body's local space into the first body's local space) before each test.
 */
bvh::Predicates<geometry::OBB, geometry::Face> make_predicates(
    const Frame& relative, Real epsilon = geometry::OVERLAP_EPSILON);

/**
 * @brief True iff the surfaces of @p a and @p b intersect
 */
bool collide(const Body& a, const Body& b, Real epsilon = geometry::OVERLAP_EPSILON);

/**
 * @brief collide() that also records traversal counters and hit node ids
 *
 * `trace.hits_a` refers to NodeIds in `a.bounds()`, `trace.hits_b` to
 * NodeIds in `b.bounds()`.
 */
bool collide_traced(const Body& a, const Body& b, bvh::TraversalTrace& trace,
                    Real epsilon = geometry::OVERLAP_EPSILON);

} // namespace obbcollide::collision
