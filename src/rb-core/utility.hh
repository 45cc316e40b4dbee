#pragma once

#include <rb-core/fwd.hh>
#include <rb-core/macros.hh>

#include <cstddef>
#include <type_traits>

namespace rb
{
// casts without pulling in <utility>

template <class T>
[[nodiscard]] RB_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] RB_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Assigns new_val to obj and returns the previous value of obj.
///   auto previous = rb::exchange(node->value, rb::move(value));
///   auto* root = rb::exchange(_root, nullptr);
template <class T, class U = T>
[[nodiscard]] RB_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val)
{
    T old_val = static_cast<T&&>(obj);
    obj = static_cast<U&&>(new_val);
    return old_val;
}

/// Tag for rb's own placement new, so <new> is not needed and no user overload can interfere.
///   new (rb::placement_new, &storage.value) T(args...);
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new;

namespace impl
{
template <class T, bool = std::is_trivially_destructible_v<T>>
union storage_for_impl
{
    T value;

    constexpr storage_for_impl() {}
};

template <class T>
union storage_for_impl<T, false>
{
    T value;

    constexpr storage_for_impl() {}
    ~storage_for_impl() {}
};
} // namespace impl

/// Raw storage for one T. The owner constructs and destroys `value` explicitly.
/// Trivially destructible whenever T is, so optional<int> stays trivial.
template <class T>
using storage_for = impl::storage_for_impl<T>;

/// End marker of the map's iteration ranges: an iterator compares equal to it once exhausted.
struct sentinel
{
};
} // namespace rb

[[nodiscard]] inline void* operator new(std::size_t, rb::placement_new_t, void* buffer) noexcept
{
    return buffer;
}
inline void operator delete(void*, rb::placement_new_t, void*) noexcept {}
