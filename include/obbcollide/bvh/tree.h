#pragma once
/**
 * @file tree.h
 * @brief Immutable binary tree with distinct internal and leaf payloads
 *
 * A tree is either a Leaf holding an `L`, or a Node holding an `N` and
 * exactly two child subtrees. Trees are never empty and offer no mutation
 * API; children are shared through `std::shared_ptr<const Tree>`, so
 * copying a tree is cheap and copies may be read from any thread.
 */

#include "obbcollide/core/types.h"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>
#include <variant>

namespace obbcollide::bvh {

/**
 * @brief Pre-order index of a subtree within its root tree
 *
 * The root is 0, the left child of `id` is `id + 1` and the right child is
 * `id + 1 + left.size()`.
 */
using NodeId = SizeT;

template <typename N, typename L>
class Tree {
public:
    using NodePayload = N;
    using LeafPayload = L;
    using Ptr = std::shared_ptr<const Tree>;

    struct Leaf {
        L payload;
    };

    struct Node {
        N payload;
        Ptr left;
        Ptr right;
    };

    static Tree leaf(L payload) {
        return Tree(Leaf{std::move(payload)}, 1, 0, 1);
    }

    static Tree node(N payload, Tree left, Tree right) {
        return node(std::move(payload),
                    std::make_shared<const Tree>(std::move(left)),
                    std::make_shared<const Tree>(std::move(right)));
    }

    static Tree node(N payload, Ptr left, Ptr right) {
        if (!left || !right) {
            throw std::invalid_argument("Tree::node requires two children");
        }
        SizeT size = 1 + left->size() + right->size();
        SizeT depth = 1 + std::max(left->depth(), right->depth());
        SizeT leaves = left->leaf_count() + right->leaf_count();
        return Tree(Node{std::move(payload), std::move(left), std::move(right)},
                    size, depth, leaves);
    }

    bool is_leaf() const noexcept { return std::holds_alternative<Leaf>(data_); }

    // Payload accessors throw std::bad_variant_access on the wrong kind
    const L& leaf_payload() const { return std::get<Leaf>(data_).payload; }
    const N& node_payload() const { return std::get<Node>(data_).payload; }
    const Tree& left() const { return *std::get<Node>(data_).left; }
    const Tree& right() const { return *std::get<Node>(data_).right; }

    const Leaf* as_leaf() const noexcept { return std::get_if<Leaf>(&data_); }
    const Node* as_node() const noexcept { return std::get_if<Node>(&data_); }

    /// Total number of nodes and leaves
    SizeT size() const noexcept { return size_; }

    /// Edges on the longest root-to-leaf path (a single leaf has depth 0)
    SizeT depth() const noexcept { return depth_; }

    SizeT leaf_count() const noexcept { return leaf_count_; }

    /**
     * @brief Visit leaf payloads from left to right
     */
    template <typename Fn>
    void for_each_leaf(Fn&& fn) const {
        if (const Leaf* l = as_leaf()) {
            fn(l->payload);
            return;
        }
        const Node& n = std::get<Node>(data_);
        n.left->for_each_leaf(fn);
        n.right->for_each_leaf(fn);
    }

    /**
     * @brief Deep structural and payload equality
     */
    friend bool operator==(const Tree& a, const Tree& b) {
        if (a.size_ != b.size_ || a.is_leaf() != b.is_leaf()) {
            return false;
        }
        if (const Leaf* la = a.as_leaf()) {
            return la->payload == b.as_leaf()->payload;
        }
        const Node& na = *a.as_node();
        const Node& nb = *b.as_node();
        return na.payload == nb.payload &&
               (na.left == nb.left || *na.left == *nb.left) &&
               (na.right == nb.right || *na.right == *nb.right);
    }

    friend bool operator!=(const Tree& a, const Tree& b) {
        return !(a == b);
    }

private:
    template <typename Data>
    Tree(Data data, SizeT size, SizeT depth, SizeT leaves)
        : data_(std::move(data)), size_(size), depth_(depth), leaf_count_(leaves) {}

    std::variant<Leaf, Node> data_;
    SizeT size_;
    SizeT depth_;
    SizeT leaf_count_;
};

} // namespace obbcollide::bvh
