/**
 * @file body.cpp
 * @brief Body values and the collide entry point
 */

#include "obbcollide/collision/body.h"
#include "obbcollide/core/log.h"

#include <stdexcept>
#include <utility>

namespace obbcollide::collision {

using geometry::Face;
using geometry::OBB;

Body::Body(Frame frame, std::shared_ptr<const ObbTree> bounds)
    : frame_(frame), bounds_(std::move(bounds)) {
    if (!bounds_) {
        log::logger()->error("Body constructed without a tree");
        throw std::invalid_argument("Body requires a tree");
    }
}

Body Body::from_faces(const std::vector<Face>& faces,
                      const Frame& frame,
                      const bvh::BuildOptions& options) {
    return Body(frame, std::make_shared<const ObbTree>(bvh::build_tree(faces, options)));
}

Body Body::with_frame(const Frame& frame) const {
    return Body(frame, bounds_);
}

Body Body::translated(const Vec3& offset) const {
    return with_frame(frame_.translated(offset));
}

Body Body::rotated(const Quat& rotation) const {
    return with_frame(Frame{frame_.position, (rotation * frame_.orientation).normalized()});
}

bvh::Predicates<OBB, Face> make_predicates(const Frame& relative, Real epsilon) {
    bvh::Predicates<OBB, Face> preds;
    preds.node_node = [relative, epsilon](const OBB& a, const OBB& b) {
        return geometry::box_box(a, b.transformed(relative), epsilon);
    };
    preds.leaf_leaf = [relative, epsilon](const Face& a, const Face& b) {
        return geometry::triangle_triangle(a, b.transformed(relative), epsilon);
    };
    preds.node_leaf = [relative, epsilon](const OBB& a, const Face& b) {
        return geometry::box_triangle(a, b.transformed(relative), epsilon);
    };
    preds.leaf_node = [relative, epsilon](const Face& a, const OBB& b) {
        return geometry::triangle_box(a, b.transformed(relative), epsilon);
    };
    return preds;
}

namespace {

// Maps b-local coordinates into a-local coordinates
Frame relative_frame(const Body& a, const Body& b) {
    return a.frame().inverse() * b.frame();
}

} // anonymous namespace

bool collide(const Body& a, const Body& b, Real epsilon) {
    return bvh::collide_recurse(a.bounds(), b.bounds(),
                                make_predicates(relative_frame(a, b), epsilon));
}

bool collide_traced(const Body& a, const Body& b, bvh::TraversalTrace& trace, Real epsilon) {
    const bool hit = bvh::collide_recurse(a.bounds(), b.bounds(),
                                          make_predicates(relative_frame(a, b), epsilon), trace);
    log::logger()->debug("collide: {} after {} tests ({} node-node, {} leaf-leaf)",
                         hit ? "hit" : "miss", trace.total_tests(),
                         trace.node_node_tests, trace.leaf_leaf_tests);
    return hit;
}

} // namespace obbcollide::collision
