#include <rb-core/node_allocation.hh>

#include <new>

std::byte* rb::allocate_node_bytes(isize size, isize alignment)
{
    RB_ASSERT(size > 0, "nodes must not be empty");
    RB_ASSERT(alignment > 0 && (alignment & (alignment - 1)) == 0, "alignment must be a power of two");

    // the aligned overloads also cover over-aligned node types
    return static_cast<std::byte*>(::operator new(std::size_t(size), std::align_val_t(alignment)));
}

void rb::node_allocation_free(std::byte* ptr, isize size, isize alignment) noexcept
{
    if (ptr == nullptr)
        return;

    ::operator delete(ptr, std::size_t(size), std::align_val_t(alignment));
}
