/**
 * @file builder.cpp
 * @brief OBB tree construction
 */

#include "obbcollide/bvh/builder.h"
#include "obbcollide/core/log.h"

#include <array>
#include <stdexcept>

namespace obbcollide::bvh {

using geometry::Face;
using geometry::OBB;

namespace {

// Box axes ordered by decreasing half-extent, index order on ties
std::array<SizeT, 3> axes_by_extent(const OBB& box) {
    std::array<SizeT, 3> order{0, 1, 2};
    std::stable_sort(order.begin(), order.end(), [&box](SizeT i, SizeT j) {
        return box.half_extents[i] > box.half_extents[j];
    });
    return order;
}

Split<Face> split_by_position(const std::vector<Face>& faces) {
    const SizeT boundary = (faces.size() + 1) / 2;
    Split<Face> split;
    split.first.assign(faces.begin(), faces.begin() + boundary);
    split.second.assign(faces.begin() + boundary, faces.end());
    return split;
}

ObbTree build_subtree(const std::vector<Face>& faces, const BuildOptions& options) {
    if (faces.size() == 1) {
        return ObbTree::leaf(faces.front());
    }

    OBB box = geometry::fit_obb(faces, options.fit_mode);

    std::optional<Split<Face>> split;
    for (SizeT i : axes_by_extent(box)) {
        split = project_and_split(box.axis(i), faces, options.split_epsilon);
        if (split) break;
    }

    if (!split) {
        log::logger()->debug("build_tree: no separating axis for {} faces, splitting by position",
                             faces.size());
        split = split_by_position(faces);
    }

    ObbTree left = build_subtree(split->first, options);
    ObbTree right = build_subtree(split->second, options);
    return ObbTree::node(box, std::move(left), std::move(right));
}

} // anonymous namespace

std::optional<Split<Face>> project_and_split(const Vec3& axis,
                                             const std::vector<Face>& faces,
                                             Real epsilon) {
    std::vector<Projected<Face>> items;
    items.reserve(faces.size());
    for (const auto& face : faces) {
        items.push_back({face, face.centroid().dot(axis)});
    }
    return split_by_projection(items, epsilon);
}

ObbTree build_tree(const std::vector<Face>& faces, const BuildOptions& options) {
    if (faces.empty()) {
        log::logger()->error("build_tree called with an empty face list");
        throw std::invalid_argument("build_tree requires at least one face");
    }

    ObbTree tree = build_subtree(faces, options);
    log::logger()->debug("build_tree: {} faces, {} nodes, depth {}",
                         faces.size(), tree.size(), tree.depth());
    return tree;
}

} // namespace obbcollide::bvh
