#pragma once

#include <ash-core/allocation.hh>
#include <ash-core/assert.hh>
#include <ash-core/fwd.hh>
#include <ash-core/utility.hh>

#include <cstdint>
#include <cstring>
#include <type_traits>

/// Owner of zero or one heap block sized in elements of T.
///
/// raw_buffer has no notion of "used" length: it only knows its capacity. Which elements inside the
/// block carry meaning is decided by the owning container (gap_buffer<T> keeps a front and a back region).
///
/// Invariants:
/// - capacity() == 0 <=> data() == nullptr (an empty raw_buffer never allocates and never dereferences)
/// - 0 <= capacity() <= max_capacity(), so every element offset fits into isize
/// - the block was obtained from resource() with _alloc_bytes >= capacity() * sizeof(T) and _alignment
/// - the block is returned to resource() exactly once (destruction, set_capacity(0), move-assignment, extraction)
///
/// The memory resource is sticky: a raw_buffer seeded with a custom resource keeps allocating from it,
/// even after its capacity dropped back to zero.
///
/// Only trivially copyable T: reallocation copies bytes and never runs constructors or destructors.
template <class T>
struct ash::raw_buffer
{
    static_assert(std::is_trivially_copyable_v<T>, "ash::raw_buffer only supports trivially copyable types");

    // construction
public:
    /// Zero capacity, default memory resource, no allocation.
    raw_buffer() = default;

    /// Zero capacity, no allocation, but future allocations use `resource` (nullptr means default).
    explicit raw_buffer(memory_resource const* resource) : _resource(resource) {}

    /// Allocates room for exactly `capacity` elements.
    /// Fatal if capacity > max_capacity() or if the allocation fails.
    [[nodiscard]] static raw_buffer create_with_capacity(isize capacity, memory_resource const* resource = nullptr)
    {
        raw_buffer result(resource);
        result.set_capacity(capacity);
        return result;
    }

    /// Takes over the block of `alloc` without copying.
    /// The live window of `alloc` is moved to the start of the block, i.e. the first
    /// alloc.obj_span().size() elements of the result hold the former live elements.
    /// Capacity is everything the block can hold, which may exceed the live element count.
    [[nodiscard]] static raw_buffer create_from_allocation(allocation<T>&& alloc)
    {
        raw_buffer result(alloc.custom_resource);
        if (!alloc.is_valid())
            return result;

        auto const live = alloc.obj_span();
        auto* const base = reinterpret_cast<T*>(alloc.alloc_start);
        if (live.data() != base && !live.empty())
            std::memmove(base, live.data(), live.size_bytes());

        result._data = base;
        result._capacity = alloc.alloc_size_bytes() / isize(sizeof(T));
        result._alloc_bytes = alloc.alloc_size_bytes();
        result._alignment = alloc.alignment;

        // ownership transferred, alloc must not free the block anymore
        alloc.obj_start = nullptr;
        alloc.obj_end = nullptr;
        alloc.alloc_start = nullptr;
        alloc.alloc_end = nullptr;
        alloc.alignment = 0;

        if (result._capacity == 0)
            result.release();

        return result;
    }

    // lifecycle
public:
    raw_buffer(raw_buffer const&) = delete;
    raw_buffer& operator=(raw_buffer const&) = delete;

    raw_buffer(raw_buffer&& rhs) noexcept
      : _data(ash::exchange(rhs._data, nullptr)),
        _capacity(ash::exchange(rhs._capacity, 0)),
        _alloc_bytes(ash::exchange(rhs._alloc_bytes, 0)),
        _alignment(ash::exchange(rhs._alignment, 0)),
        _resource(rhs._resource) // rhs resource stays
    {
    }

    raw_buffer& operator=(raw_buffer&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release();
            _data = ash::exchange(rhs._data, nullptr);
            _capacity = ash::exchange(rhs._capacity, 0);
            _alloc_bytes = ash::exchange(rhs._alloc_bytes, 0);
            _alignment = ash::exchange(rhs._alignment, 0);
            _resource = rhs._resource;
        }
        return *this;
    }

    ~raw_buffer() { release(); }

    // capacity management
public:
    /// Largest representable capacity: offsets in bytes never exceed the signed range.
    [[nodiscard]] static constexpr isize max_capacity() { return isize(PTRDIFF_MAX / sizeof(T)); }

    /// Reallocates to exactly `new_capacity` elements (grow, shrink, or free when 0).
    /// No-op if unchanged. The first min(capacity(), new_capacity) elements are preserved.
    /// Tries to resize in place first, otherwise allocates a new block, copies, and frees the old one.
    /// Fatal if new_capacity > max_capacity() or if the allocation fails.
    void set_capacity(isize new_capacity)
    {
        ASH_ASSERT(new_capacity >= 0, "capacity must be non-negative");
        ASH_ASSERT_ALWAYS(new_capacity <= max_capacity(), "capacity overflows isize max");

        if (new_capacity == _capacity)
            return;

        if (new_capacity == 0)
        {
            release();
            return;
        }

        if (try_resize_in_place(new_capacity))
            return;

        auto const& res = resource();
        auto const new_bytes = new_capacity * isize(sizeof(T));
        auto* const new_data = reinterpret_cast<T*>(res.allocate_bytes(new_bytes, alignof(T), res.userdata));

        auto const preserved = ash::min(_capacity, new_capacity);
        if (preserved > 0)
            std::memcpy(new_data, _data, preserved * sizeof(T));

        release();
        _data = new_data;
        _capacity = new_capacity;
        _alloc_bytes = new_bytes;
        _alignment = alignof(T);
    }

    /// Attempts to change the capacity to exactly `new_capacity` without moving the block.
    /// Returns false (and changes nothing) if there is no block or the resource refuses.
    /// On success, the first min(old, new) elements are preserved at the same addresses.
    [[nodiscard]] bool try_resize_in_place(isize new_capacity)
    {
        ASH_ASSERT(new_capacity > 0, "in-place resize needs a positive capacity");
        ASH_ASSERT_ALWAYS(new_capacity <= max_capacity(), "capacity overflows isize max");

        if (_data == nullptr)
            return false;

        auto const& res = resource();
        auto const new_bytes = new_capacity * isize(sizeof(T));
        auto const result_bytes = res.try_resize_bytes_in_place(reinterpret_cast<ash::byte*>(_data), _alloc_bytes,
                                                                new_bytes, new_bytes, _alignment, res.userdata);
        if (result_bytes == -1)
            return false;

        _capacity = new_capacity;
        _alloc_bytes = result_bytes;
        return true;
    }

    /// Hands the block out as an allocation whose live window is the first `live_count` elements.
    /// Leaves this raw_buffer empty (capacity 0) but keeps its resource.
    [[nodiscard]] allocation<T> extract_allocation(isize live_count)
    {
        ASH_ASSERT(0 <= live_count && live_count <= _capacity, "live count out of bounds");

        allocation<T> result;
        result.custom_resource = _resource;
        if (_data == nullptr)
            return result;

        result.alloc_start = reinterpret_cast<ash::byte*>(_data);
        result.alloc_end = result.alloc_start + _alloc_bytes;
        result.alignment = _alignment;
        result.obj_start = _data;
        result.obj_end = _data + live_count;

        _data = nullptr;
        _capacity = 0;
        _alloc_bytes = 0;
        _alignment = 0;
        return result;
    }

    // queries
public:
    [[nodiscard]] T* data() { return _data; }
    [[nodiscard]] T const* data() const { return _data; }

    [[nodiscard]] isize capacity() const { return _capacity; }

    /// Effective resource, nullptr resolved to the default
    [[nodiscard]] memory_resource const& resource() const { return resolve_memory_resource(_resource); }

    /// Resource as passed at creation, nullptr meaning the default
    [[nodiscard]] memory_resource const* custom_resource() const { return _resource; }

private:
    void release()
    {
        if (_data != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(reinterpret_cast<ash::byte*>(_data), _alloc_bytes, _alignment, res.userdata);
        }
        _data = nullptr;
        _capacity = 0;
        _alloc_bytes = 0;
        _alignment = 0;
    }

    // members
private:
    T* _data = nullptr;
    isize _capacity = 0;
    isize _alloc_bytes = 0;
    isize _alignment = 0;
    memory_resource const* _resource = nullptr;
};
