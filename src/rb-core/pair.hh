#pragma once

#include <rb-core/fwd.hh>

#include <cstddef>
#include <type_traits>
#include <utility> // tuple_size, tuple_element

/// A map entry: key in `first`, value in `second`.
///   pair<K, V>                owns both, returned by remove_entry / pop_first / pop_last
///   pair<K const&, V const&>  borrows from the map, returned by get_key_value / first / last
///   pair<K const&, V&>        what iterating a non-const map yields
/// Supports structured bindings: for (auto const& [key, value] : m)
template <class T, class U>
struct rb::pair
{
    T first;
    U second;

    // (first) instead of first so that reference members stay references
    template <std::size_t I>
    [[nodiscard]] constexpr decltype(auto) get() & noexcept
    {
        if constexpr (I == 0)
            return (first);
        else
            return (second);
    }
    template <std::size_t I>
    [[nodiscard]] constexpr decltype(auto) get() const& noexcept
    {
        if constexpr (I == 0)
            return (first);
        else
            return (second);
    }
    template <std::size_t I>
    [[nodiscard]] constexpr decltype(auto) get() && noexcept
    {
        if constexpr (I == 0)
            return static_cast<T&&>(first);
        else
            return static_cast<U&&>(second);
    }

    // deleted (not just unused) for reference pairs
    [[nodiscard]] friend constexpr bool operator==(pair const&, pair const&) = default;
};

template <class T, class U>
struct std::tuple_size<rb::pair<T, U>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class T, class U>
struct std::tuple_element<I, rb::pair<T, U>>
{
    static_assert(I < 2, "rb::pair has two elements");
    using type = std::conditional_t<I == 0, T, U>;
};
