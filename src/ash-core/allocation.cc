#include "allocation.hh"

#include <ash-core/assertf.hh>
#include <ash-core/macros.hh>
#include <ash-core/utility.hh>

#include <cstdlib>

namespace
{
// The system resource ignores userdata, the system allocator is stateless.

ash::byte* system_try_allocate_bytes(ash::isize bytes, ash::isize alignment, void* userdata)
{
    ASH_UNUSED(userdata);

    ASH_ASSERT(bytes >= 0, "byte count must be non-negative");
    ASH_ASSERT(alignment > 0 && ash::is_power_of_two(alignment), "alignment must be a power of 2");

    if (bytes == 0)
        return nullptr;

#ifdef ASH_OS_WINDOWS
    return static_cast<ash::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign instead of std::aligned_alloc to avoid the bytes % alignment == 0 requirement.
    // posix_memalign requires alignment >= sizeof(void*), so we clamp to that minimum.
    void* raw_ptr = nullptr;
    ash::isize const effective_alignment = alignment < ash::isize(sizeof(void*)) ? ash::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, effective_alignment, bytes);
    return result == 0 ? static_cast<ash::byte*>(raw_ptr) : nullptr;
#endif
}

ash::byte* system_allocate_bytes(ash::isize bytes, ash::isize alignment, void* userdata)
{
    if (bytes == 0)
        return nullptr;

    ash::byte* const p = system_try_allocate_bytes(bytes, alignment, userdata);

    // allocator exhaustion is fatal in every build
    ASH_ASSERTF_ALWAYS(p != nullptr, "allocation failed: requested {} bytes with alignment {}", bytes, alignment);
    return p;
}

void system_deallocate_bytes(ash::byte* p, ash::isize bytes, ash::isize alignment, void* userdata)
{
    ASH_UNUSED(bytes);
    ASH_UNUSED(alignment);
    ASH_UNUSED(userdata);

    // _aligned_malloc requires _aligned_free, posix_memalign pairs with std::free
#ifdef ASH_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

ash::isize system_try_resize_bytes_in_place(ash::byte* p,
                                            ash::isize old_bytes,
                                            ash::isize min_bytes,
                                            ash::isize max_bytes,
                                            ash::isize alignment,
                                            void* userdata)
{
    ASH_UNUSED(userdata);

    ASH_ASSERT(p != nullptr, "cannot resize null pointer");
    ASH_ASSERT(alignment > 0 && ash::is_power_of_two(alignment), "alignment must be a power of 2");
    ASH_ASSERT(old_bytes > 0, "old_bytes must be positive");
    ASH_ASSERT(1 <= min_bytes && min_bytes <= max_bytes, "must have 1 <= min_bytes <= max_bytes");

    ASH_UNUSED(p);
    ASH_UNUSED(old_bytes);
    ASH_UNUSED(min_bytes);
    ASH_UNUSED(max_bytes);
    ASH_UNUSED(alignment);

    // malloc-family allocators cannot resize in place without possibly moving (realloc)
    return -1;
}

/// Stored in the data segment (not on heap) so it remains valid during static initialization.
constinit ash::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .try_allocate_bytes = system_try_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .try_resize_bytes_in_place = system_try_resize_bytes_in_place,
    .userdata = nullptr,
};

} // namespace

constinit ash::memory_resource const* const ash::default_memory_resource = &system_memory_resource;
