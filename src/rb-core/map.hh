#pragma once

#include <rb-core/assert.hh>
#include <rb-core/fwd.hh>
#include <rb-core/impl/tree.hh>
#include <rb-core/node_allocation.hh>
#include <rb-core/optional.hh>
#include <rb-core/pair.hh>
#include <rb-core/utility.hh>

#include <compare>
#include <concepts>
#include <type_traits>

namespace rb::impl
{
/// Q can be used to look up keys of type K: q <=> k must yield a (at least) weak ordering
template <class Q, class K>
concept key_comparable_with = requires(Q const& q, K const& k) {
    { q <=> k } -> std::convertible_to<std::weak_ordering>;
};

template <class K, class V>
struct map_node : tree_node_base
{
    using key_t = K;
    using value_t = V;

    // never changes while the node is linked, only moved out right before the node is freed
    K key;
    V value;

    template <class KeyT, class ValueT>
    map_node(KeyT&& k, ValueT&& v) : key(rb::forward<KeyT>(k)), value(rb::forward<ValueT>(v))
    {
    }
};

/// In-order cursor over map nodes, ascending or (Reverse) descending.
/// NodeT is map_node<K, V> or map_node<K, V> const; keys are always handed out as const.
/// The end of a traversal is reached when the cursor compares equal to rb::sentinel.
template <class NodeT, bool Reverse>
struct map_iterator
{
    using key_ref = typename NodeT::key_t const&;
    using value_ref = std::conditional_t<std::is_const_v<NodeT>, typename NodeT::value_t const&, typename NodeT::value_t&>;

    map_iterator() = default;
    explicit map_iterator(NodeT* node) : _node(node) {}

    [[nodiscard]] rb::pair<key_ref, value_ref> operator*() const
    {
        RB_ASSERT(_node != nullptr, "dereferencing an iterator past the end");
        return {_node->key, _node->value};
    }

    map_iterator& operator++()
    {
        RB_ASSERT(_node != nullptr, "incrementing an iterator past the end");
        if constexpr (Reverse)
            _node = static_cast<NodeT*>(tree_prev(_node));
        else
            _node = static_cast<NodeT*>(tree_next(_node));
        return *this;
    }

    map_iterator operator++(int)
    {
        auto copy = *this;
        ++*this;
        return copy;
    }

    [[nodiscard]] bool operator==(map_iterator const& rhs) const { return _node == rhs._node; }
    [[nodiscard]] bool operator==(rb::sentinel) const { return _node == nullptr; }

private:
    NodeT* _node = nullptr;
};

/// Range view used by map::reversed(): iteration starts at the given node
template <class NodeT, bool Reverse>
struct map_range
{
    [[nodiscard]] map_iterator<NodeT, Reverse> begin() const { return map_iterator<NodeT, Reverse>(_first); }
    [[nodiscard]] rb::sentinel end() const { return {}; }

    NodeT* _first = nullptr;
};
} // namespace rb::impl

/// Sorted associative container mapping unique keys of type K to values of type V.
/// Implemented as a red-black tree: insert, lookup and remove are O(log n) worst case,
/// iteration visits entries in ascending key order (reversed() for descending).
///
/// Keys are ordered with operator<=>, which must be a total order.
/// Lookups accept any key-like type Q with Q <=> K (e.g. char const* for std::string keys).
///
/// Absence is not an error: get/remove return rb::nullopt for missing keys.
/// operator[] is the exception: it requires the key to be present and asserts otherwise.
///
/// Node based: references to keys and values stay valid until their own entry is removed.
/// Move-only, the map exclusively owns all its nodes.
///
/// Usage:
///   rb::map<std::string, int> m;
///   m.insert("b", 1);
///   if (auto v = m.get("b"); v.has_value())
///       use(v.value());
///   for (auto const& [key, value] : m)
///       ...
template <class K, class V>
struct rb::map
{
    static_assert(impl::key_comparable_with<K, K>, "map keys must be totally ordered via operator<=>");

    using node_t = impl::map_node<K, V>;

    using iterator = impl::map_iterator<node_t, false>;
    using const_iterator = impl::map_iterator<node_t const, false>;
    using reverse_iterator = impl::map_iterator<node_t, true>;
    using const_reverse_iterator = impl::map_iterator<node_t const, true>;

    // construction
public:
    map() = default;
    ~map() { clear(); }

    map(map&& rhs) noexcept : _root(rb::exchange(rhs._root, nullptr)), _size(rb::exchange(rhs._size, 0)) {}
    map& operator=(map&& rhs) noexcept
    {
        if (this != &rhs)
        {
            clear();
            _root = rb::exchange(rhs._root, nullptr);
            _size = rb::exchange(rhs._size, 0);
        }
        return *this;
    }

    map(map const&) = delete;
    map& operator=(map const&) = delete;

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    template <class Q>
        requires impl::key_comparable_with<Q, K>
    [[nodiscard]] bool contains_key(Q const& key) const
    {
        return _find(key) != nullptr;
    }

    // lookup
public:
    /// Returns the value stored under key, or nullopt if the key is absent.
    template <class Q>
        requires impl::key_comparable_with<Q, K>
    [[nodiscard]] optional<V const&> get(Q const& key) const
    {
        if (auto const* n = _find(key))
            return n->value;
        return rb::nullopt;
    }

    /// Mutable lookup: the value may be modified in place, the key never.
    template <class Q>
        requires impl::key_comparable_with<Q, K>
    [[nodiscard]] optional<V&> get(Q const& key)
    {
        if (auto* n = _find(key))
            return n->value;
        return rb::nullopt;
    }

    template <class Q>
        requires impl::key_comparable_with<Q, K>
    [[nodiscard]] optional<pair<K const&, V const&>> get_key_value(Q const& key) const
    {
        if (auto const* n = _find(key))
            return pair<K const&, V const&>{n->key, n->value};
        return rb::nullopt;
    }

    /// Indexed access, only defined for keys that are present.
    /// A missing key is a programmer error and fails RB_ASSERT_ALWAYS in every build mode.
    template <class Q>
        requires impl::key_comparable_with<Q, K>
    [[nodiscard]] V const& operator[](Q const& key) const
    {
        auto const* n = _find(key);
        RB_ASSERT_ALWAYS(n != nullptr, "key not found");
        return n->value;
    }
    template <class Q>
        requires impl::key_comparable_with<Q, K>
    [[nodiscard]] V& operator[](Q const& key)
    {
        auto* n = _find(key);
        RB_ASSERT_ALWAYS(n != nullptr, "key not found");
        return n->value;
    }

    /// Entry with the smallest / largest key, nullopt if empty
    [[nodiscard]] optional<pair<K const&, V const&>> first() const
    {
        if (_root == nullptr)
            return rb::nullopt;
        auto const* n = static_cast<node_t const*>(impl::tree_minimum(_root));
        return pair<K const&, V const&>{n->key, n->value};
    }
    [[nodiscard]] optional<pair<K const&, V const&>> last() const
    {
        if (_root == nullptr)
            return rb::nullopt;
        auto const* n = static_cast<node_t const*>(impl::tree_maximum(_root));
        return pair<K const&, V const&>{n->key, n->value};
    }

    // modifiers
public:
    /// Inserts key -> value.
    /// If the key is already present, its value is replaced in place and the previous value returned.
    /// Otherwise a new entry is created and nullopt is returned.
    optional<V> insert(K key, V value)
    {
        impl::tree_node_base* parent = nullptr;
        bool insert_left = false;

        auto* n = _root;
        while (n != nullptr)
        {
            auto const order = key <=> _key_of(n);
            if (order == 0)
                return optional<V>(rb::exchange(static_cast<node_t*>(n)->value, rb::move(value)));

            parent = n;
            insert_left = order < 0;
            n = insert_left ? n->left : n->right;
        }

        auto node = node_allocation<node_t>::create_from(rb::move(key), rb::move(value));
        impl::tree_insert_and_rebalance(node.release(), parent, insert_left, _root);
        ++_size;
        return rb::nullopt;
    }

    /// Removes the entry for key and returns its value, nullopt (and no change) if absent.
    template <class Q>
        requires impl::key_comparable_with<Q, K>
    optional<V> remove(Q const& key)
    {
        auto* const n = _find(key);
        if (n == nullptr)
            return rb::nullopt;

        auto const owned = _unlink(n);
        return optional<V>(rb::move(owned.ptr->value));
    }

    /// Like remove, but also hands back the stored key.
    template <class Q>
        requires impl::key_comparable_with<Q, K>
    optional<pair<K, V>> remove_entry(Q const& key)
    {
        auto* const n = _find(key);
        if (n == nullptr)
            return rb::nullopt;
        return _extract(n);
    }

    /// Removes and returns the entry with the smallest / largest key, nullopt if empty.
    optional<pair<K, V>> pop_first()
    {
        if (_root == nullptr)
            return rb::nullopt;
        return _extract(static_cast<node_t*>(impl::tree_minimum(_root)));
    }
    optional<pair<K, V>> pop_last()
    {
        if (_root == nullptr)
            return rb::nullopt;
        return _extract(static_cast<node_t*>(impl::tree_maximum(_root)));
    }

    /// Destroys all entries, size becomes 0.
    /// Frees bottom-up along parent links, no recursion.
    void clear()
    {
        auto* n = rb::exchange(_root, nullptr);
        while (n != nullptr)
        {
            if (n->left != nullptr)
                n = n->left;
            else if (n->right != nullptr)
                n = n->right;
            else
            {
                auto* const parent = n->parent;
                if (parent != nullptr)
                {
                    if (parent->left == n)
                        parent->left = nullptr;
                    else
                        parent->right = nullptr;
                }
                auto const owned = node_allocation<node_t>::adopt(static_cast<node_t*>(n));
                n = parent;
            }
        }
        _size = 0;
    }

    // iteration
public:
    [[nodiscard]] iterator begin() { return iterator(_first_node()); }
    [[nodiscard]] const_iterator begin() const { return const_iterator(_first_node()); }
    [[nodiscard]] rb::sentinel end() const { return {}; }

    /// Descending view: for (auto [key, value] : m.reversed())
    [[nodiscard]] impl::map_range<node_t, true> reversed() { return {_last_node()}; }
    [[nodiscard]] impl::map_range<node_t const, true> reversed() const { return {_last_node()}; }

    // structure inspection
public:
    /// Nodes on the longest root-to-leaf path, at most 2 * log2(size() + 1)
    [[nodiscard]] isize height() const { return impl::tree_height(_root); }

    /// Key stored at the root, nullopt if empty
    [[nodiscard]] optional<K const&> root_key() const
    {
        if (_root == nullptr)
            return rb::nullopt;
        return _key_of(_root);
    }

    /// Checks all red-black invariants, strict key order and the cached size.
    /// O(n), meant for tests and debugging.
    [[nodiscard]] bool is_valid_red_black_tree() const
    {
        if (!impl::tree_is_valid(_root))
            return false;

        isize count = 0;
        node_t const* prev = nullptr;
        for (auto const* n = _first_node(); n != nullptr; n = static_cast<node_t const*>(impl::tree_next(n)))
        {
            if (prev != nullptr && !((prev->key <=> n->key) < 0))
                return false;
            prev = n;
            ++count;
        }
        return count == _size;
    }

    // helper
private:
    [[nodiscard]] static K const& _key_of(impl::tree_node_base const* n) { return static_cast<node_t const*>(n)->key; }

    template <class Q>
    [[nodiscard]] node_t const* _find(Q const& key) const
    {
        impl::tree_node_base const* n = _root;
        while (n != nullptr)
        {
            auto const order = key <=> _key_of(n);
            if (order < 0)
                n = n->left;
            else if (order > 0)
                n = n->right;
            else
                return static_cast<node_t const*>(n);
        }
        return nullptr;
    }
    template <class Q>
    [[nodiscard]] node_t* _find(Q const& key)
    {
        return const_cast<node_t*>(static_cast<map const&>(*this)._find(key));
    }

    [[nodiscard]] node_t const* _first_node() const
    {
        return _root == nullptr ? nullptr : static_cast<node_t const*>(impl::tree_minimum(static_cast<impl::tree_node_base const*>(_root)));
    }
    [[nodiscard]] node_t* _first_node() { return const_cast<node_t*>(static_cast<map const&>(*this)._first_node()); }

    [[nodiscard]] node_t const* _last_node() const
    {
        return _root == nullptr ? nullptr : static_cast<node_t const*>(impl::tree_maximum(static_cast<impl::tree_node_base const*>(_root)));
    }
    [[nodiscard]] node_t* _last_node() { return const_cast<node_t*>(static_cast<map const&>(*this)._last_node()); }

    /// Takes n out of the tree; the returned handle owns (and eventually frees) it.
    [[nodiscard]] node_allocation<node_t> _unlink(node_t* n)
    {
        impl::tree_erase_and_rebalance(n, _root);
        --_size;
        return node_allocation<node_t>::adopt(n);
    }

    optional<pair<K, V>> _extract(node_t* n)
    {
        auto const owned = _unlink(n);
        return optional<pair<K, V>>(pair<K, V>{rb::move(owned.ptr->key), rb::move(owned.ptr->value)});
    }

    // members
private:
    impl::tree_node_base* _root = nullptr;
    isize _size = 0;
};
