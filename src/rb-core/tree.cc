#include <rb-core/impl/tree.hh>

#include <rb-core/assert.hh>
#include <rb-core/utility.hh>

#include <initializer_list>

using rb::impl::tree_color;
using rb::impl::tree_node_base;

namespace
{
// Makes new_child take old_child's place below old_child's parent (or as root).
// new_child's own parent link is left to the caller.
void replace_child(tree_node_base* old_child, tree_node_base* new_child, tree_node_base*& root) noexcept
{
    auto* const parent = old_child->parent;
    if (parent == nullptr)
        root = new_child;
    else if (parent->left == old_child)
        parent->left = new_child;
    else
        parent->right = new_child;
}

// black nodes from node (inclusive) down to an absent child, -1 on any violation
rb::isize black_count(tree_node_base const* node)
{
    if (node == nullptr)
        return 0;

    if (node->color != tree_color::red && node->color != tree_color::black)
        return -1;

    for (auto const* child : {node->left, node->right})
    {
        if (child == nullptr)
            continue;
        if (child->parent != node)
            return -1;
        if (node->color == tree_color::red && child->color == tree_color::red)
            return -1;
    }

    auto const left = black_count(node->left);
    if (left < 0)
        return -1;
    auto const right = black_count(node->right);
    if (right != left)
        return -1;

    return left + (node->color == tree_color::black ? 1 : 0);
}
} // namespace

tree_node_base const* rb::impl::tree_minimum(tree_node_base const* node) noexcept
{
    while (node->left != nullptr)
        node = node->left;
    return node;
}

tree_node_base const* rb::impl::tree_maximum(tree_node_base const* node) noexcept
{
    while (node->right != nullptr)
        node = node->right;
    return node;
}

tree_node_base const* rb::impl::tree_next(tree_node_base const* node) noexcept
{
    if (node->right != nullptr)
        return tree_minimum(node->right);

    // climb until we leave a left subtree
    auto const* parent = node->parent;
    while (parent != nullptr && node == parent->right)
    {
        node = parent;
        parent = parent->parent;
    }
    return parent;
}

tree_node_base const* rb::impl::tree_prev(tree_node_base const* node) noexcept
{
    if (node->left != nullptr)
        return tree_maximum(node->left);

    auto const* parent = node->parent;
    while (parent != nullptr && node == parent->left)
    {
        node = parent;
        parent = parent->parent;
    }
    return parent;
}

void rb::impl::tree_rotate_left(tree_node_base* x, tree_node_base*& root)
{
    auto* const y = x->right;
    RB_ASSERT(y != nullptr, "left rotation requires a right child");

    x->right = y->left;
    if (y->left != nullptr)
        y->left->parent = x;

    replace_child(x, y, root);
    y->parent = x->parent;

    y->left = x;
    x->parent = y;
}

void rb::impl::tree_rotate_right(tree_node_base* x, tree_node_base*& root)
{
    auto* const y = x->left;
    RB_ASSERT(y != nullptr, "right rotation requires a left child");

    x->left = y->right;
    if (y->right != nullptr)
        y->right->parent = x;

    replace_child(x, y, root);
    y->parent = x->parent;

    y->right = x;
    x->parent = y;
}

void rb::impl::tree_insert_and_rebalance(tree_node_base* node, tree_node_base* parent, bool insert_left, tree_node_base*& root)
{
    node->parent = parent;
    node->left = nullptr;
    node->right = nullptr;
    node->color = tree_color::red;

    if (parent == nullptr)
    {
        RB_ASSERT(root == nullptr, "only an empty tree accepts a parentless node");
        root = node;
    }
    else if (insert_left)
    {
        RB_ASSERT(parent->left == nullptr, "left child slot is occupied");
        parent->left = node;
    }
    else
    {
        RB_ASSERT(parent->right == nullptr, "right child slot is occupied");
        parent->right = node;
    }

    // node is red: the only possible violation is a red parent
    auto* x = node;
    while (x != root && x->parent->color == tree_color::red)
    {
        // a red parent is never the root, so the grandparent exists
        auto* const xp = x->parent;
        auto* const xpp = xp->parent;

        if (xp == xpp->left)
        {
            auto* const uncle = xpp->right;
            if (tree_is_red(uncle))
            {
                // red uncle: push the red up and continue from the grandparent
                xp->color = tree_color::black;
                uncle->color = tree_color::black;
                xpp->color = tree_color::red;
                x = xpp;
            }
            else
            {
                // triangle -> line
                if (x == xp->right)
                {
                    x = xp;
                    tree_rotate_left(x, root);
                }
                x->parent->color = tree_color::black;
                xpp->color = tree_color::red;
                tree_rotate_right(xpp, root);
                break;
            }
        }
        else
        {
            auto* const uncle = xpp->left;
            if (tree_is_red(uncle))
            {
                xp->color = tree_color::black;
                uncle->color = tree_color::black;
                xpp->color = tree_color::red;
                x = xpp;
            }
            else
            {
                if (x == xp->left)
                {
                    x = xp;
                    tree_rotate_right(x, root);
                }
                x->parent->color = tree_color::black;
                xpp->color = tree_color::red;
                tree_rotate_left(xpp, root);
                break;
            }
        }
    }

    root->color = tree_color::black;
}

void rb::impl::tree_erase_and_rebalance(tree_node_base* node, tree_node_base*& root)
{
    auto* const z = node;
    auto* y = z;          // node leaving its structural position
    tree_node_base* x;    // replacement in that position, may be absent
    tree_node_base* x_parent;

    if (z->left == nullptr)
        x = z->right;
    else if (z->right == nullptr)
        x = z->left;
    else
    {
        y = tree_minimum(z->right);
        x = y->right;
    }

    if (y != z)
    {
        // the successor y (no left child) moves into z's place
        z->left->parent = y;
        y->left = z->left;

        if (y != z->right)
        {
            x_parent = y->parent;
            if (x != nullptr)
                x->parent = y->parent;
            y->parent->left = x;

            y->right = z->right;
            z->right->parent = y;
        }
        else
        {
            x_parent = y;
        }

        replace_child(z, y, root);
        y->parent = z->parent;

        // y inherits z's color, the color lost at y's old position is now kept in z
        z->color = rb::exchange(y->color, z->color);
    }
    else
    {
        x_parent = z->parent;
        if (x != nullptr)
            x->parent = z->parent;
        replace_child(z, x, root);
    }

    auto const removed_color = z->color;
    z->parent = nullptr;
    z->left = nullptr;
    z->right = nullptr;

    if (removed_color == tree_color::red)
        return;

    // x carries an extra black until it reaches the root or a red node
    while (x != root && tree_is_black(x))
    {
        if (x == x_parent->left)
        {
            auto* sibling = x_parent->right;
            if (tree_is_red(sibling))
            {
                sibling->color = tree_color::black;
                x_parent->color = tree_color::red;
                tree_rotate_left(x_parent, root);
                sibling = x_parent->right;
            }

            if (tree_is_black(sibling->left) && tree_is_black(sibling->right))
            {
                sibling->color = tree_color::red;
                x = x_parent;
                x_parent = x_parent->parent;
            }
            else
            {
                // only the near nephew is red: turn it into the far one
                if (tree_is_black(sibling->right))
                {
                    sibling->left->color = tree_color::black;
                    sibling->color = tree_color::red;
                    tree_rotate_right(sibling, root);
                    sibling = x_parent->right;
                }

                sibling->color = x_parent->color;
                x_parent->color = tree_color::black;
                sibling->right->color = tree_color::black;
                tree_rotate_left(x_parent, root);
                x = root;
            }
        }
        else
        {
            auto* sibling = x_parent->left;
            if (tree_is_red(sibling))
            {
                sibling->color = tree_color::black;
                x_parent->color = tree_color::red;
                tree_rotate_right(x_parent, root);
                sibling = x_parent->left;
            }

            if (tree_is_black(sibling->right) && tree_is_black(sibling->left))
            {
                sibling->color = tree_color::red;
                x = x_parent;
                x_parent = x_parent->parent;
            }
            else
            {
                if (tree_is_black(sibling->left))
                {
                    sibling->right->color = tree_color::black;
                    sibling->color = tree_color::red;
                    tree_rotate_left(sibling, root);
                    sibling = x_parent->left;
                }

                sibling->color = x_parent->color;
                x_parent->color = tree_color::black;
                sibling->left->color = tree_color::black;
                tree_rotate_right(x_parent, root);
                x = root;
            }
        }
    }

    if (x != nullptr)
        x->color = tree_color::black;
}

rb::isize rb::impl::tree_height(tree_node_base const* root)
{
    if (root == nullptr)
        return 0;
    auto const left = tree_height(root->left);
    auto const right = tree_height(root->right);
    return 1 + (left < right ? right : left);
}

rb::isize rb::impl::tree_black_height(tree_node_base const* root)
{
    auto const count = black_count(root);
    if (count < 0)
        return -1;
    if (root != nullptr && root->color == tree_color::black)
        return count - 1;
    return count;
}

bool rb::impl::tree_is_valid(tree_node_base const* root)
{
    if (root == nullptr)
        return true;
    if (root->parent != nullptr || root->color != tree_color::black)
        return false;
    return black_count(root) >= 0;
}
