#pragma once
/**
 * @file inspect.h
 * @brief Read-only tree queries for drawing and highlighting
 */

#include "obbcollide/bvh/tree.h"

#include <set>
#include <variant>
#include <vector>

namespace obbcollide::bvh {

/**
 * @brief One node or leaf of a tree, with its position in the tree
 */
template <typename N, typename L>
struct TreeEntry {
    NodeId id;
    SizeT depth;
    std::variant<N, L> payload;

    // Index based so that N and L may be the same type
    bool is_leaf() const noexcept { return payload.index() == 1; }
};

namespace detail {

template <typename N, typename L, typename Keep>
void collect(const Tree<N, L>& tree, NodeId id, SizeT depth, SizeT max_depth,
             const Keep& keep, std::vector<TreeEntry<N, L>>& out) {
    if (depth > max_depth) {
        return;
    }
    if (const auto* leaf = tree.as_leaf()) {
        if (keep(id)) {
            out.push_back({id, depth, std::variant<N, L>(std::in_place_index<1>, leaf->payload)});
        }
        return;
    }
    const auto& node = *tree.as_node();
    if (keep(id)) {
        out.push_back({id, depth, std::variant<N, L>(std::in_place_index<0>, node.payload)});
    }
    collect(*node.left, id + 1, depth + 1, max_depth, keep, out);
    collect(*node.right, id + 1 + node.left->size(), depth + 1, max_depth, keep, out);
}

} // namespace detail

/**
 * @brief Every node and leaf at depth <= @p max_depth, in pre-order
 *
 * The root has depth 0.
 */
template <typename N, typename L>
std::vector<TreeEntry<N, L>> entries_to_depth(const Tree<N, L>& tree, SizeT max_depth) {
    std::vector<TreeEntry<N, L>> out;
    detail::collect(tree, 0, 0, max_depth, [](NodeId) { return true; }, out);
    return out;
}

/**
 * @brief Entries whose NodeId is in @p ids, in pre-order
 *
 * Unknown ids are ignored.
 */
template <typename N, typename L>
std::vector<TreeEntry<N, L>> select_entries(const Tree<N, L>& tree, const std::set<NodeId>& ids) {
    std::vector<TreeEntry<N, L>> out;
    if (ids.empty()) {
        return out;
    }
    detail::collect(tree, 0, 0, tree.depth(),
                    [&ids](NodeId id) { return ids.count(id) > 0; }, out);
    return out;
}

} // namespace obbcollide::bvh
