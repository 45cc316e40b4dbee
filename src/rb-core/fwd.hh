#pragma once

#include <cstdint>

namespace rb
{
// primitives

using u8 = std::uint8_t;
using i64 = std::int64_t;

/// Signed size type used for sizes, counts and heights.
using isize = i64;

// forward declarations

template <class T, class U>
struct pair;

struct sentinel;

struct nullopt_t;
template <class T>
struct optional;

template <class T>
struct node_allocation;

template <class K, class V>
struct map;
} // namespace rb
