#pragma once

#include <rb-core/assert.hh>
#include <rb-core/fwd.hh>
#include <rb-core/utility.hh>

#include <type_traits>

// Return types of the map API:
//   optional<V>           owning, from insert (previous value), remove, pop_first, ...
//   optional<V&>          borrowing, from get / first / last / root_key
// Both compare against rb::nullopt and against a plain value; value() asserts presence.

struct rb::nullopt_t
{
    struct tag_t
    {
    };
    explicit constexpr nullopt_t(tag_t) {}
};

namespace rb
{
inline constexpr nullopt_t nullopt{nullopt_t::tag_t{}};
}

template <class T>
struct rb::optional
{
    static_assert(!std::is_reference_v<T>, "reference optionals use the optional<T&> specialization");

public:
    optional() = default;
    optional(nullopt_t) {}

    template <class U = T>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (rb::placement_new, &_storage.value) T(rb::forward<U>(value));
    }

    // trivially copyable payloads keep optional trivially copyable
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // everything else is move-only: the map hands out values, it never needs to copy them
    optional(optional&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires(!std::is_trivially_copyable_v<T>)
    {
        _take(rhs);
    }
    optional& operator=(optional&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this != &rhs)
        {
            _reset();
            _take(rhs);
        }
        return *this;
    }
    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        _reset();
    }

public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    [[nodiscard]] T& value() &
    {
        RB_ASSERT(_has_value, "accessing the value of an empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        RB_ASSERT(_has_value, "accessing the value of an empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        RB_ASSERT(_has_value, "accessing the value of an empty optional");
        return rb::move(_storage.value);
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

private:
    // rhs is left empty
    void _take(optional& rhs)
    {
        if (!rhs._has_value)
            return;
        new (rb::placement_new, &_storage.value) T(rb::move(rhs._storage.value));
        _has_value = true;
        rhs._reset();
    }

    void _reset()
    {
        if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }
    }

    rb::storage_for<T> _storage;
    bool _has_value = false;
};

/// Borrowed view of an object owned elsewhere (a map entry), or empty. Only a pointer.
/// Stays valid as long as the entry it refers to is not removed.
template <class T>
struct rb::optional<T&>
{
public:
    optional() = default;
    optional(nullopt_t) {}

    constexpr optional(T& value) : _ptr(&value) {} // NOLINT
    optional(T&&) = delete;

    // optional<V&> -> optional<V const&>
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U*, T*>)
    constexpr optional(optional<U&> const& rhs) : _ptr(rhs.has_value() ? &rhs.value() : nullptr) // NOLINT
    {
    }

public:
    [[nodiscard]] bool has_value() const { return _ptr != nullptr; }

    [[nodiscard]] T& value() const
    {
        RB_ASSERT(_ptr != nullptr, "accessing the value of an empty optional");
        return *_ptr;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return lhs._ptr == nullptr; }

    /// compares the referenced object, not the address
    [[nodiscard]] friend bool operator==(optional const& lhs, std::remove_const_t<T> const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        return lhs._ptr != nullptr && *lhs._ptr == rhs;
    }

private:
    T* _ptr = nullptr;
};
