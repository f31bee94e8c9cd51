#pragma once

#include <ash-core/fwd.hh>
#include <ash-core/span.hh>
#include <ash-core/utility.hh>

#include <cstdint>
#include <cstring>
#include <type_traits>

// ash::allocation<T> is the owning "flat buffer" handle used to move element storage in and out of
// the gap containers without copying.
//
// It models two things explicitly:
// 1) which bytes are owned (the allocation from an ash::memory_resource),
// 2) which elements inside those bytes are live (the live window).
//
// Memory is obtained from a polymorphic ash::memory_resource (POD, function-pointer based, static-init safe).
// The resource pointer is stored *in the allocation*, not as a template argument. A null resource
// means "use ash::default_memory_resource".
//
// Two allocations (or an allocation and a container) are said to have matching allocators when their
// resources resolve to the same ash::memory_resource. Only then can storage change hands zero-copy.
//
// Core invariants:
// - [alloc_start, alloc_end) is the owned byte range (exclusive end).
// - [obj_start, obj_end) is the live element range (exclusive end), always within the allocation.
// - obj_start and obj_end are always aligned to alignof(T), even when empty.
// - custom_resource == nullptr implies use of ash::default_memory_resource.
//
// Only trivially copyable element types are supported: the gap containers relocate elements with
// memmove and never run constructors or destructors on them.

namespace ash
{
/// Default memory resource used when a custom resource is nullptr.
/// This is a system allocator stored in the data segment, making the pointer valid even during
/// static initialization in other translation units.
extern ash::memory_resource const* const default_memory_resource;
} // namespace ash

/// Polymorphic memory resource interface powering ash::allocation<T> and ash::raw_buffer<T>.
/// Custom allocators implement this interface to provide pluggable allocation strategies.
/// This is a POD struct using function pointers to avoid virtual dispatch and non-trivial constructors.
struct ash::memory_resource
{
    /// Allocate `bytes` bytes with at least `alignment` alignment.
    /// bytes == 0 always returns nullptr.
    /// bytes > 0 always returns non-null; failure is fatal (assert/terminate) or throws.
    ash::function_ptr<ash::byte*(isize bytes, isize alignment, void* userdata)> allocate_bytes = nullptr;

    /// Like allocate_bytes, but returns nullptr on failure instead of terminating.
    ash::function_ptr<ash::byte*(isize bytes, isize alignment, void* userdata)> try_allocate_bytes = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    /// `p` must be the exact pointer returned by allocate_bytes or try_allocate_bytes.
    ash::function_ptr<void(ash::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// Attempt to resize an existing allocation in place without moving or freeing it.
    ///
    /// Preconditions:
    /// `p` was allocated from this resource with `old_bytes` and `alignment`.
    /// `1 <= min_bytes <= max_bytes`.
    ///
    /// Success (returns new_bytes in [min_bytes, max_bytes]):
    /// The allocation remains at address `p`, the first min(old_bytes, new_bytes) bytes are preserved,
    /// and the returned size becomes the canonical size for future resize/deallocate calls.
    ///
    /// Failure (returns -1):
    /// The allocation remains valid and unchanged at `p` with size `old_bytes`.
    ///
    /// Unlike realloc, this never moves the block. Callers that need to relocate do so themselves
    /// and can lay out the data differently in the new block (e.g. re-close a gap in the same pass).
    ash::function_ptr<isize(ash::byte* p, isize old_bytes, isize min_bytes, isize max_bytes, isize alignment, void* userdata)>
        try_resize_bytes_in_place = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};

namespace ash
{
/// Resolves nullptr to the default memory resource
[[nodiscard]] inline ash::memory_resource const& resolve_memory_resource(ash::memory_resource const* resource)
{
    return resource ? *resource : *default_memory_resource;
}
} // namespace ash

/// Owning allocation handle for a contiguous byte block plus a typed live window inside it.
///
/// This is the externally-owned flat buffer of the gap containers:
/// - gap_buffer<T>::create_from_allocation adopts the live window as the front region,
/// - gap_buffer<T>::extract_allocation returns front-then-back as one live window.
///
/// Move-only. The block is returned to its resource exactly once, on destruction or move-assignment.
template <class T>
struct ash::allocation
{
    static_assert(std::is_trivially_copyable_v<T>, "ash::allocation only supports trivially copyable types");

    /// Pointer to the first live element.
    /// INVARIANT: Must always be aligned to alignof(T), even if the range is empty.
    T* obj_start = nullptr;

    /// Pointer one past the last live element (exclusive end).
    T* obj_end = nullptr;

    /// Start of the owned byte allocation (base pointer returned by the memory resource).
    /// This pointer must be passed back to the memory resource for deallocation.
    ash::byte* alloc_start = nullptr;

    /// End of the owned byte allocation (exclusive).
    ash::byte* alloc_end = nullptr;

    /// Alignment that was used when allocating [alloc_start, alloc_end) from the resource.
    isize alignment = 0;

    /// Memory resource that owns the allocation, or nullptr for the global default.
    /// Null means "use global fallback". This makes the all-zero state a valid empty allocation.
    ash::memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    /// Returns the effective resource to use for allocation operations.
    [[nodiscard]] ash::memory_resource const& resource() const { return resolve_memory_resource(custom_resource); }

    /// True iff this owns a block of at least one byte
    /// But obj_span might still be empty
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    /// Returns the span of live elements
    [[nodiscard]] ash::span<T> obj_span() const { return ash::span<T>(obj_start, obj_end - obj_start); }

    /// Number of allocated bytes
    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    // factories
public:
    /// Creates an empty allocation with room for `capacity` elements but no live elements.
    /// The result has obj_start == obj_end == alloc_start.
    /// capacity == 0 results in nullptr with no real allocation call.
    [[nodiscard]] static allocation create_empty(isize capacity, memory_resource const* resource = nullptr)
    {
        ASH_ASSERT(capacity >= 0, "capacity must be non-negative");
        ASH_ASSERT_ALWAYS(capacity <= isize(PTRDIFF_MAX / sizeof(T)), "capacity overflows isize max");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignof(T);

        if (capacity > 0)
        {
            auto const& res = resolve_memory_resource(resource);
            auto const bytes = capacity * isize(sizeof(T));
            result.alloc_start = res.allocate_bytes(bytes, result.alignment, res.userdata);
            result.alloc_end = result.alloc_start + bytes;
        }

        result.obj_start = reinterpret_cast<T*>(result.alloc_start);
        result.obj_end = result.obj_start;
        return result;
    }

    /// Creates a tight copy of a span of elements using the specified memory resource.
    /// Empty spans result in nullptr with no real allocation call.
    [[nodiscard]] static allocation create_copy_of(span<T const> source, memory_resource const* resource = nullptr)
    {
        auto result = allocation::create_empty(source.size(), resource);
        if (!source.empty())
            std::memcpy(result.obj_start, source.data(), source.size_bytes());
        result.obj_end = result.obj_start + source.size();
        return result;
    }

    // lifecycle
public:
    allocation() = default;

    // no implicit copies for allocations
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(ash::exchange(rhs.obj_start, nullptr)),
        obj_end(ash::exchange(rhs.obj_end, nullptr)),
        alloc_start(ash::exchange(rhs.alloc_start, nullptr)),
        alloc_end(ash::exchange(rhs.alloc_end, nullptr)),
        alignment(ash::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = ash::move(rhs);

            free_block();

            obj_start = ash::exchange(rhs_tmp.obj_start, nullptr);
            obj_end = ash::exchange(rhs_tmp.obj_end, nullptr);
            alloc_start = ash::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = ash::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = ash::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource; // rhs resource stays
        }

        return *this;
    }

    ~allocation() { free_block(); }

private:
    void free_block()
    {
        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
    }
};
