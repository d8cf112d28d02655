#pragma once
/**
 * @file traversal.h
 * @brief Generic lock-step collision traversal over two trees
 *
 * The traversal knows nothing about geometry or frames. Callers bind four
 * predicates for the payload kinds; a false gate at any internal pair
 * prunes every pair below it.
 */

#include "obbcollide/bvh/tree.h"

#include <functional>
#include <set>

namespace obbcollide::bvh {

/**
 * @brief Predicate set for collide_recurse
 *
 * `node_leaf` and `leaf_node` are independent functions; the set is
 * symmetric in shape but not assumed commutative.
 */
template <typename N, typename L>
struct Predicates {
    std::function<bool(const N&, const N&)> node_node;
    std::function<bool(const L&, const L&)> leaf_leaf;
    std::function<bool(const N&, const L&)> node_leaf;
    std::function<bool(const L&, const N&)> leaf_node;
};

/**
 * @brief Counters and hit sets recorded by a traced traversal
 *
 * `hits_a` / `hits_b` hold the NodeIds (within tree a / tree b) of every
 * node or leaf that took part in a predicate call returning true.
 */
struct TraversalTrace {
    SizeT node_node_tests{0};
    SizeT node_leaf_tests{0};
    SizeT leaf_node_tests{0};
    SizeT leaf_leaf_tests{0};
    std::set<NodeId> hits_a;
    std::set<NodeId> hits_b;

    SizeT total_tests() const noexcept {
        return node_node_tests + node_leaf_tests + leaf_node_tests + leaf_leaf_tests;
    }

    void reset() { *this = TraversalTrace{}; }
};

namespace detail {

template <typename N, typename L>
bool recurse(const Tree<N, L>& a, NodeId id_a,
             const Tree<N, L>& b, NodeId id_b,
             const Predicates<N, L>& preds, TraversalTrace* trace) {
    auto record = [trace, id_a, id_b](bool hit, SizeT TraversalTrace::*counter) {
        if (trace) {
            ++(trace->*counter);
            if (hit) {
                trace->hits_a.insert(id_a);
                trace->hits_b.insert(id_b);
            }
        }
        return hit;
    };

    const auto* leaf_a = a.as_leaf();
    const auto* leaf_b = b.as_leaf();

    // Leaf vs leaf: terminal
    if (leaf_a && leaf_b) {
        return record(preds.leaf_leaf(leaf_a->payload, leaf_b->payload),
                      &TraversalTrace::leaf_leaf_tests);
    }

    // Node vs leaf: descend a
    if (leaf_b) {
        const auto& node_a = *a.as_node();
        if (!record(preds.node_leaf(node_a.payload, leaf_b->payload),
                    &TraversalTrace::node_leaf_tests)) {
            return false;
        }
        const NodeId left_a = id_a + 1;
        const NodeId right_a = left_a + node_a.left->size();
        return recurse(*node_a.left, left_a, b, id_b, preds, trace) ||
               recurse(*node_a.right, right_a, b, id_b, preds, trace);
    }

    // Leaf vs node: descend b
    if (leaf_a) {
        const auto& node_b = *b.as_node();
        if (!record(preds.leaf_node(leaf_a->payload, node_b.payload),
                    &TraversalTrace::leaf_node_tests)) {
            return false;
        }
        const NodeId left_b = id_b + 1;
        const NodeId right_b = left_b + node_b.left->size();
        return recurse(a, id_a, *node_b.left, left_b, preds, trace) ||
               recurse(a, id_a, *node_b.right, right_b, preds, trace);
    }

    // Node vs node: descend both, four cross pairs
    const auto& node_a = *a.as_node();
    const auto& node_b = *b.as_node();
    if (!record(preds.node_node(node_a.payload, node_b.payload),
                &TraversalTrace::node_node_tests)) {
        return false;
    }
    const NodeId left_a = id_a + 1;
    const NodeId right_a = left_a + node_a.left->size();
    const NodeId left_b = id_b + 1;
    const NodeId right_b = left_b + node_b.left->size();
    return recurse(*node_a.left, left_a, *node_b.left, left_b, preds, trace) ||
           recurse(*node_a.left, left_a, *node_b.right, right_b, preds, trace) ||
           recurse(*node_a.right, right_a, *node_b.left, left_b, preds, trace) ||
           recurse(*node_a.right, right_a, *node_b.right, right_b, preds, trace);
}

} // namespace detail

/**
 * @brief True iff some leaf pair reached through a chain of true gates
 *        satisfies `leaf_leaf`
 *
 * Evaluation is depth-first and short-circuits on the first true pair,
 * in the order (left, left), (left, right), (right, left), (right, right).
 */
template <typename N, typename L>
bool collide_recurse(const Tree<N, L>& a, const Tree<N, L>& b,
                     const Predicates<N, L>& preds) {
    return detail::recurse(a, 0, b, 0, preds, nullptr);
}

/**
 * @brief collide_recurse that also records counters and hit ids in @p trace
 *
 * The trace is accumulated, not cleared.
 */
template <typename N, typename L>
bool collide_recurse(const Tree<N, L>& a, const Tree<N, L>& b,
                     const Predicates<N, L>& preds, TraversalTrace& trace) {
    return detail::recurse(a, 0, b, 0, preds, &trace);
}

} // namespace obbcollide::bvh
