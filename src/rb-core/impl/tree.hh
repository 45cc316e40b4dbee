#pragma once

#include <rb-core/fwd.hh>

// =========================================================================================================
// Untyped red-black tree engine
// =========================================================================================================
//
// The engine only knows links and colors. Typed containers (rb::map) derive their nodes from
// tree_node_base, do the key comparisons themselves and hand the engine the position to work on.
// Everything here is non-template and lives in tree.cc.
//
// Conventions:
//   - nullptr is the absent child and counts as black
//   - root is passed by reference because rotations at the top replace it
//   - parent links are non-owning, the container owns every node
//
// Invariants restored by tree_insert_and_rebalance and tree_erase_and_rebalance:
//   1. every node is red or black
//   2. the root is black
//   3. a red node has no red child
//   4. all paths from a node to its absent children contain the same number of black nodes
//

namespace rb::impl
{
enum class tree_color : u8
{
    red,
    black,
};

struct tree_node_base
{
    tree_node_base* parent = nullptr;
    tree_node_base* left = nullptr;
    tree_node_base* right = nullptr;
    tree_color color = tree_color::red;
};

[[nodiscard]] inline bool tree_is_red(tree_node_base const* node) noexcept
{
    return node != nullptr && node->color == tree_color::red;
}
[[nodiscard]] inline bool tree_is_black(tree_node_base const* node) noexcept
{
    return !tree_is_red(node);
}

// =========================================================================================================
// Navigation
// =========================================================================================================

/// Leftmost / rightmost node of the subtree rooted at node (node must not be null)
[[nodiscard]] tree_node_base const* tree_minimum(tree_node_base const* node) noexcept;
[[nodiscard]] tree_node_base const* tree_maximum(tree_node_base const* node) noexcept;

/// In-order successor / predecessor, nullptr past the last / before the first node
[[nodiscard]] tree_node_base const* tree_next(tree_node_base const* node) noexcept;
[[nodiscard]] tree_node_base const* tree_prev(tree_node_base const* node) noexcept;

[[nodiscard]] inline tree_node_base* tree_minimum(tree_node_base* node) noexcept
{
    return const_cast<tree_node_base*>(tree_minimum(static_cast<tree_node_base const*>(node)));
}
[[nodiscard]] inline tree_node_base* tree_maximum(tree_node_base* node) noexcept
{
    return const_cast<tree_node_base*>(tree_maximum(static_cast<tree_node_base const*>(node)));
}
[[nodiscard]] inline tree_node_base* tree_next(tree_node_base* node) noexcept
{
    return const_cast<tree_node_base*>(tree_next(static_cast<tree_node_base const*>(node)));
}
[[nodiscard]] inline tree_node_base* tree_prev(tree_node_base* node) noexcept
{
    return const_cast<tree_node_base*>(tree_prev(static_cast<tree_node_base const*>(node)));
}

// =========================================================================================================
// Restructuring
// =========================================================================================================

/// Promotes x->right into x's position, x becomes its left child.
/// Updates all parent links and the grandparent link (or root when x is the root).
/// Precondition: x->right != nullptr
void tree_rotate_left(tree_node_base* x, tree_node_base*& root);

/// Mirror of tree_rotate_left. Precondition: x->left != nullptr
void tree_rotate_right(tree_node_base* x, tree_node_base*& root);

/// Links a fresh node as left/right child of parent (or as root when parent is null),
/// colors it red and restores the red-black invariants.
/// Precondition: the chosen child slot of parent is empty
void tree_insert_and_rebalance(tree_node_base* node, tree_node_base* parent, bool insert_left, tree_node_base*& root);

/// Unlinks node from the tree and restores the red-black invariants.
/// A node with two children is replaced by its in-order successor, which takes over its position
/// and color; nodes are relinked, never copied, so all other nodes keep their identity.
/// Afterwards node is detached and owned by the caller.
void tree_erase_and_rebalance(tree_node_base* node, tree_node_base*& root);

// =========================================================================================================
// Inspection
// =========================================================================================================

/// Number of nodes on the longest path from root to an absent child (0 for an empty tree)
[[nodiscard]] isize tree_height(tree_node_base const* root);

/// Black nodes on every path from root to an absent child, excluding the root itself
/// Returns -1 if the subtree violates invariants 1, 3 or 4 or has inconsistent parent links
[[nodiscard]] isize tree_black_height(tree_node_base const* root);

/// Checks invariants 1 to 4 and parent link consistency of a whole tree
/// Key order (invariant 5) needs the keys and is checked by the typed container
[[nodiscard]] bool tree_is_valid(tree_node_base const* root);
} // namespace rb::impl
