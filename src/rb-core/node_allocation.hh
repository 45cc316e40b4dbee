#pragma once

#include <rb-core/assert.hh>
#include <rb-core/fwd.hh>
#include <rb-core/utility.hh>

#include <cstddef>

namespace rb
{
/// Raw memory for a single node of the given size and alignment.
/// Never returns nullptr, throws std::bad_alloc when out of memory.
/// Must be returned via node_allocation_free with the same size and alignment.
[[nodiscard]] std::byte* allocate_node_bytes(isize size, isize alignment);

/// Returns memory from allocate_node_bytes. ptr may be nullptr.
void node_allocation_free(std::byte* ptr, isize size, isize alignment) noexcept;
} // namespace rb

/// Move-only owning handle for a single T living in node memory.
/// Stores only the T*; size and alignment for freeing are derived from T.
/// The destructor runs ~T() and frees the memory.
///
/// Node-based containers create their nodes through this handle, release() them while they are
/// linked into the container's structure and adopt() them again once unlinked, so an unlinked node
/// is always owned by a handle and cannot leak, even when moving its contents out throws.
///
///   auto node = rb::node_allocation<node_t>::create_from(rb::move(key), rb::move(value));
///   link(node.release());
///   ...
///   auto owned = rb::node_allocation<node_t>::adopt(unlink(n)); // freed at scope exit
template <class T>
struct rb::node_allocation
{
    // factory
public:
    /// Constructs a T in fresh node memory. If the constructor throws, the memory is freed again.
    template <class... Args>
    [[nodiscard]] static node_allocation create_from(Args&&... args)
    {
        static_assert(requires { T(rb::forward<Args>(args)...); }, "T is not constructible from the provided argument types");

        struct free_on_throw
        {
            std::byte* bytes;
            ~free_on_throw() { rb::node_allocation_free(bytes, sizeof(T), alignof(T)); }
        };

        auto guard = free_on_throw{rb::allocate_node_bytes(sizeof(T), alignof(T))};

        node_allocation n;
        n.ptr = new (rb::placement_new, guard.bytes) T(rb::forward<Args>(args)...);
        guard.bytes = nullptr;
        return n;
    }

    /// Takes back ownership of a pointer previously obtained from release().
    [[nodiscard]] static node_allocation adopt(T* ptr)
    {
        node_allocation n;
        n.ptr = ptr;
        return n;
    }

    /// Gives up ownership without destroying; the caller must adopt() the pointer again eventually.
    [[nodiscard]] T* release() { return rb::exchange(ptr, nullptr); }

    [[nodiscard]] bool is_valid() const { return ptr != nullptr; }

    // ctors/dtor
public:
    node_allocation() = default;

    node_allocation(node_allocation&& rhs) noexcept : ptr(rb::exchange(rhs.ptr, nullptr)) {}
    node_allocation& operator=(node_allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            _destroy();
            ptr = rb::exchange(rhs.ptr, nullptr);
        }
        return *this;
    }
    node_allocation(node_allocation const&) = delete;
    node_allocation& operator=(node_allocation const&) = delete;

    ~node_allocation() { _destroy(); }

    // members
public:
    /// nullptr for an empty handle
    T* ptr = nullptr;

private:
    void _destroy()
    {
        if (ptr != nullptr)
        {
            ptr->~T();
            rb::node_allocation_free(reinterpret_cast<std::byte*>(rb::exchange(ptr, nullptr)), sizeof(T), alignof(T)); // NOLINT
        }
    }
};
