#pragma once

#include <ash-core/allocation.hh>
#include <ash-core/assert.hh>
#include <ash-core/fwd.hh>
#include <ash-core/macros.hh>
#include <ash-core/optional.hh>
#include <ash-core/raw_buffer.hh>
#include <ash-core/span.hh>
#include <ash-core/utility.hh>

#include <cstring>
#include <iterator>
#include <type_traits>

// ash::gap_buffer<T> is a growable array with a single movable hole ("gap") in its storage.
//
// The capacity of the underlying raw_buffer is split into three parts:
//
//   offset 0                   front_size          capacity - back_size          capacity
//   | front region ............ | gap ................ | back region ............ |
//
// Logical content is front region followed by back region. The gap holds no meaningful data and is
// never exposed. Inserting at the gap (push / push_back) is amortized O(1); moving the gap to another
// logical index (set_gap) costs O(distance moved), never O(size).
//
// Index mapping (two comparisons, no branches over the whole buffer):
//   i <  front_size  -> offset i
//   i >= front_size  -> offset i + gap_size
//
// Invariants:
// - front_size() + back_size() <= capacity() <= max_capacity()
// - an empty gap_buffer never allocates, the first push allocates
// - every fatal precondition (ASH_ASSERT_ALWAYS) is checked before anything is mutated
//
// Reallocation (push*, reserve, shrink*, extract_allocation) invalidates all spans, pointers and
// iterators obtained from the buffer. Arguments of push_slice / push_slice_back must not alias the buffer.
//
// T must be trivially copyable: elements are relocated with memmove / memcpy.
//
// Usage:
//   auto buf = ash::gap_buffer<char>();
//   buf.push_slice({'a', 'c'});  // front: "ac"
//   buf.set_gap(1);              // front: "a", back: "c"
//   buf.push('b');               // front: "ab", back: "c"
template <class T>
struct ash::gap_buffer
{
    static_assert(std::is_trivially_copyable_v<T>, "ash::gap_buffer only supports trivially copyable types");

    template <class U>
    struct basic_iterator;
    using iterator = basic_iterator<T>;
    using const_iterator = basic_iterator<T const>;

    // construction
public:
    /// Empty buffer, default memory resource, no allocation.
    gap_buffer() = default;

    /// Empty buffer, no allocation, all future allocations use `resource`.
    explicit gap_buffer(memory_resource const* resource) : _buf(resource) {}

    /// Empty buffer whose gap can hold exactly `capacity` elements.
    [[nodiscard]] static gap_buffer create_with_capacity(isize capacity, memory_resource const* resource = nullptr)
    {
        gap_buffer result;
        result._buf = raw_buffer<T>::create_with_capacity(capacity, resource);
        return result;
    }

    /// Tight copy of `source` as the front region.
    [[nodiscard]] static gap_buffer create_copy_of(span<T const> source, memory_resource const* resource = nullptr)
    {
        auto result = gap_buffer::create_with_capacity(source.size(), resource);
        result.push_slice(source);
        return result;
    }

    /// Adopts the block of `alloc` without copying; its live window becomes the front region.
    /// Spare bytes of the block become the gap. The buffer uses the resource of the allocation.
    [[nodiscard]] static gap_buffer create_from_allocation(allocation<T>&& alloc)
    {
        auto const live_count = alloc.obj_end - alloc.obj_start;

        gap_buffer result;
        result._buf = raw_buffer<T>::create_from_allocation(ash::move(alloc));
        result._front_len = live_count;
        return result;
    }

    /// Like create_from_allocation(alloc), but the result is guaranteed to use `resource`.
    /// Zero-copy if the allocation already uses the same (resolved) resource, otherwise the
    /// live window is copied and `alloc` is freed.
    [[nodiscard]] static gap_buffer create_from_allocation(allocation<T>&& alloc, memory_resource const* resource)
    {
        if (&alloc.resource() == &resolve_memory_resource(resource))
        {
            alloc.custom_resource = resource;
            return gap_buffer::create_from_allocation(ash::move(alloc));
        }

        auto result = gap_buffer::create_copy_of(alloc.obj_span(), resource);
        alloc = allocation<T>();
        return result;
    }

    // lifecycle
public:
    /// Deep copy with the same front/back split and the same resource.
    /// The copy is tight: its gap is empty.
    gap_buffer(gap_buffer const& rhs)
      : _buf(raw_buffer<T>::create_with_capacity(rhs.size(), rhs._buf.custom_resource())),
        _front_len(rhs._front_len),
        _back_len(rhs._back_len)
    {
        copy_n(_buf.data(), rhs.front().data(), _front_len);
        copy_n(_buf.data() + back_start(), rhs.back().data(), _back_len);
    }

    gap_buffer& operator=(gap_buffer const& rhs)
    {
        if (this != &rhs)
            *this = gap_buffer(rhs);
        return *this;
    }

    /// Moves leave rhs empty (without allocation) but keep its resource.
    gap_buffer(gap_buffer&& rhs) noexcept
      : _buf(ash::move(rhs._buf)), _front_len(ash::exchange(rhs._front_len, 0)), _back_len(ash::exchange(rhs._back_len, 0))
    {
    }

    gap_buffer& operator=(gap_buffer&& rhs) noexcept
    {
        if (this != &rhs)
        {
            _buf = ash::move(rhs._buf);
            _front_len = ash::exchange(rhs._front_len, 0);
            _back_len = ash::exchange(rhs._back_len, 0);
        }
        return *this;
    }

    ~gap_buffer() = default;

    // insertion
public:
    /// Appends to the front region, i.e. inserts right before the gap.
    /// Amortized O(1).
    void push(T value)
    {
        reserve(1);
        _buf.data()[_front_len] = value;
        ++_front_len;
    }

    /// Prepends to the back region, i.e. inserts right after the gap.
    /// Amortized O(1). Elements pushed this way appear in reverse push order in back().
    void push_back(T value)
    {
        reserve(1);
        _buf.data()[back_start() - 1] = value;
        ++_back_len;
    }

    /// Appends all of `source` to the front region, at most one reallocation.
    void push_slice(span<T const> source)
    {
        reserve(source.size());
        copy_n(_buf.data() + _front_len, source.data(), source.size());
        _front_len += source.size();
    }

    /// Prepends all of `source` (in order) to the back region, at most one reallocation.
    /// Afterwards back() starts with `source`.
    void push_slice_back(span<T const> source)
    {
        reserve(source.size());
        copy_n(_buf.data() + back_start() - source.size(), source.data(), source.size());
        _back_len += source.size();
    }

    // removal
public:
    /// Removes and returns the last element of the front region, empty if there is none.
    [[nodiscard]] optional<T> pop()
    {
        if (_front_len == 0)
            return nullopt;

        --_front_len;
        return _buf.data()[_front_len];
    }

    /// Removes and returns the first element of the back region, empty if there is none.
    [[nodiscard]] optional<T> pop_back()
    {
        if (_back_len == 0)
            return nullopt;

        T const value = _buf.data()[back_start()];
        --_back_len;
        return value;
    }

    /// Moves the last min(dest.size(), front_size()) elements of the front region into the start of `dest`
    /// (in order) and returns how many were moved. Fewer than dest.size() is not an error.
    [[nodiscard]] isize pop_slice(span<T> dest)
    {
        auto const count = ash::min(dest.size(), _front_len);
        _front_len -= count;
        copy_n(dest.data(), _buf.data() + _front_len, count);
        return count;
    }

    /// Moves the first min(dest.size(), back_size()) elements of the back region into the start of `dest`
    /// (in order) and returns how many were moved. Fewer than dest.size() is not an error.
    [[nodiscard]] isize pop_slice_back(span<T> dest)
    {
        auto const count = ash::min(dest.size(), _back_len);
        copy_n(dest.data(), _buf.data() + back_start(), count);
        _back_len -= count;
        return count;
    }

    /// Shortens the front region to at most `len` elements, dropping from its end (next to the gap).
    /// Never reallocates; the dropped elements become gap.
    void truncate_front(isize len)
    {
        ASH_ASSERT(len >= 0, "length must be non-negative");
        _front_len = ash::min(_front_len, len);
    }

    /// Shortens the back region to at most `len` elements, dropping from its start (next to the gap).
    /// Never reallocates; the dropped elements become gap.
    void truncate_back(isize len)
    {
        ASH_ASSERT(len >= 0, "length must be non-negative");
        _back_len = ash::min(_back_len, len);
    }

    /// Drops all elements, keeps the capacity.
    void clear()
    {
        _front_len = 0;
        _back_len = 0;
    }

    // element access
public:
    /// Pointer to the element at logical index i, nullptr if i is out of range.
    [[nodiscard]] T* get(isize i) { return i < 0 || i >= size() ? nullptr : _buf.data() + offset_of(i); }
    [[nodiscard]] T const* get(isize i) const { return i < 0 || i >= size() ? nullptr : _buf.data() + offset_of(i); }

    /// Element at logical index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T& operator[](isize i)
    {
        ASH_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _buf.data()[offset_of(i)];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        ASH_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _buf.data()[offset_of(i)];
    }

    /// The elements before the gap, in logical order.
    [[nodiscard]] span<T> front() { return span<T>(_buf.data(), _front_len); }
    [[nodiscard]] span<T const> front() const { return span<T const>(_buf.data(), _front_len); }

    /// The elements after the gap, in logical order.
    [[nodiscard]] span<T> back() { return span<T>(_buf.data() + back_start(), _back_len); }
    [[nodiscard]] span<T const> back() const { return span<T const>(_buf.data() + back_start(), _back_len); }

    // gap
public:
    /// Moves the gap so that the front region holds exactly the first `index` elements.
    ///
    /// Moves |index - front_size()| elements across the gap and never reallocates.
    /// Calling it again with the same index is a no-op.
    /// Fatal ("index out of bounds") if index > size().
    void set_gap(isize index)
    {
        ASH_ASSERT_ALWAYS(0 <= index && index <= size(), "index out of bounds");

        if (index < _front_len)
        {
            // tail of the front region becomes head of the back region
            auto const count = _front_len - index;
            move_n(_buf.data() + back_start() - count, _buf.data() + index, count);
            _front_len = index;
            _back_len += count;
        }
        else if (index > _front_len)
        {
            // head of the back region becomes tail of the front region
            auto const count = index - _front_len;
            move_n(_buf.data() + _front_len, _buf.data() + back_start(), count);
            _front_len = index;
            _back_len -= count;
        }
    }

    // capacity
public:
    /// Ensures the gap can hold `additional` more elements without reallocating.
    /// Grows according to grow_capacity_for; both regions are relocated in a single pass.
    /// Fatal ("capacity overflows isize max") if size() + additional exceeds max_capacity().
    void reserve(isize additional)
    {
        ASH_ASSERT(additional >= 0, "additional must be non-negative");
        ASH_ASSERT_ALWAYS(additional <= max_capacity() - size(), "capacity overflows isize max");

        auto const required = size() + additional;
        if (required <= capacity())
            return;

        grow_to(grow_capacity_for(capacity(), required));
    }

    /// Growth policy: the capacity to use when `required` elements do not fit into `capacity`.
    ///
    /// Doubles, but grows by at least min_growth elements, so that small buffers do not reallocate
    /// on every push. Never returns less than `required` and never more than max_capacity().
    /// Returns `capacity` unchanged if required already fits.
    ///
    ///   grow_capacity_for(0, 1)    == 64
    ///   grow_capacity_for(64, 65)  == 128
    ///   grow_capacity_for(10, 11)  == 74
    ///   grow_capacity_for(0, 123)  == 123
    [[nodiscard]] static constexpr isize grow_capacity_for(isize capacity, isize required)
    {
        ASH_ASSERT(0 <= capacity && capacity <= max_capacity(), "invalid capacity");
        ASH_ASSERT(0 <= required && required <= max_capacity(), "invalid required capacity");

        if (required <= capacity)
            return capacity;

        auto const growth = ash::max(capacity, min_growth);
        auto const grown = capacity > max_capacity() - growth ? max_capacity() : capacity + growth;
        return ash::max(grown, required);
    }

    /// Reduces the capacity to max(size(), capacity), closing the gap as far as possible.
    /// Does nothing if the capacity is already at most `capacity`.
    /// Fatal ("capacity smaller than length") if capacity < size().
    void shrink_to(isize capacity)
    {
        ASH_ASSERT_ALWAYS(capacity >= size(), "capacity smaller than length");

        if (capacity >= this->capacity())
            return;

        // the back region must end at the new capacity, move it before the block shrinks
        move_n(_buf.data() + capacity - _back_len, _buf.data() + back_start(), _back_len);
        _buf.set_capacity(capacity);
    }

    /// Reduces the capacity to size(); the gap becomes empty.
    void shrink_to_fit() { shrink_to(size()); }

    // export
public:
    /// Closes the gap, shrinks to fit and hands out the storage as one flat allocation (front then back).
    /// The shrink happens in place when the resource supports it, otherwise it reallocates once.
    /// Leaves this buffer empty (no allocation) with its resource.
    [[nodiscard]] allocation<T> extract_allocation()
    {
        auto const len = size();
        set_gap(len);
        shrink_to_fit();
        _front_len = 0;
        _back_len = 0;
        return _buf.extract_allocation(len);
    }

    /// Like extract_allocation(), but the result is guaranteed to use `resource`.
    /// Same as extract_allocation() if this buffer already uses the same (resolved) resource, otherwise the
    /// content is copied into a tight allocation from `resource` and this buffer's storage is freed.
    [[nodiscard]] allocation<T> extract_allocation(memory_resource const* resource)
    {
        if (&_buf.resource() == &resolve_memory_resource(resource))
        {
            auto result = extract_allocation();
            result.custom_resource = resource;
            return result;
        }

        auto result = allocation<T>::create_empty(size(), resource);
        copy_n(result.obj_end, _buf.data(), _front_len);
        result.obj_end += _front_len;
        copy_n(result.obj_end, _buf.data() + back_start(), _back_len);
        result.obj_end += _back_len;

        *this = gap_buffer(_buf.custom_resource());
        return result;
    }

    // iterators
public:
    /// Iteration walks the front region, then the back region, skipping the gap.
    [[nodiscard]] iterator begin() { return iterator(first_ptr(), gap_begin(), gap_end()); }
    [[nodiscard]] iterator end() { return iterator(_buf.data() + capacity(), gap_begin(), gap_end()); }
    [[nodiscard]] const_iterator begin() const { return const_iterator(first_ptr(), gap_begin(), gap_end()); }
    [[nodiscard]] const_iterator end() const
    {
        return const_iterator(_buf.data() + capacity(), gap_begin(), gap_end());
    }

    // queries
public:
    /// Total number of elements (front + back).
    [[nodiscard]] isize size() const { return _front_len + _back_len; }
    [[nodiscard]] bool empty() const { return size() == 0; }

    [[nodiscard]] isize front_size() const { return _front_len; }
    [[nodiscard]] isize back_size() const { return _back_len; }

    /// Number of elements that can be pushed without reallocation.
    [[nodiscard]] isize gap_size() const { return capacity() - size(); }

    [[nodiscard]] isize capacity() const { return _buf.capacity(); }

    [[nodiscard]] static constexpr isize max_capacity() { return raw_buffer<T>::max_capacity(); }

    /// Effective resource used for all allocations of this buffer.
    [[nodiscard]] memory_resource const& resource() const { return _buf.resource(); }

    // helper
private:
    static constexpr isize min_growth = 64;

    [[nodiscard]] isize back_start() const { return capacity() - _back_len; }

    [[nodiscard]] isize offset_of(isize i) const { return i < _front_len ? i : i + gap_size(); }

    [[nodiscard]] T* first_ptr() const
    {
        return const_cast<T*>(_buf.data()) + (_front_len > 0 ? 0 : back_start());
    }
    [[nodiscard]] T* gap_begin() const { return const_cast<T*>(_buf.data()) + _front_len; }
    [[nodiscard]] T* gap_end() const { return const_cast<T*>(_buf.data()) + back_start(); }

    static void copy_n(T* dest, T const* src, isize count)
    {
        if (count > 0)
            std::memcpy(dest, src, count * sizeof(T));
    }

    // overlapping ranges
    static void move_n(T* dest, T const* src, isize count)
    {
        if (count > 0 && dest != src)
            std::memmove(dest, src, count * sizeof(T));
    }

    /// Reallocates to new_capacity and re-closes the gap in the same pass:
    /// front region stays at offset 0, back region ends at new_capacity.
    ASH_COLD_FUNC void grow_to(isize new_capacity)
    {
        ASH_ASSERT(new_capacity > capacity(), "grow_to must grow");

        auto const old_back_start = back_start();

        if (_buf.try_resize_in_place(new_capacity))
        {
            move_n(_buf.data() + new_capacity - _back_len, _buf.data() + old_back_start, _back_len);
            return;
        }

        auto next = raw_buffer<T>::create_with_capacity(new_capacity, _buf.custom_resource());
        copy_n(next.data(), _buf.data(), _front_len);
        copy_n(next.data() + new_capacity - _back_len, _buf.data() + old_back_start, _back_len);
        _buf = ash::move(next);
    }

    // members
private:
    raw_buffer<T> _buf;
    isize _front_len = 0;
    isize _back_len = 0;
};

/// Bidirectional iterator over the logical content of a gap_buffer.
/// Stepping off the end of the front region jumps over the gap.
template <class T>
template <class U>
struct ash::gap_buffer<T>::basic_iterator
{
    using iterator_category = std::bidirectional_iterator_tag;
    using value_type = std::remove_const_t<U>;
    using difference_type = isize;
    using reference = U&;
    using pointer = U*;

    basic_iterator() = default;

    [[nodiscard]] U& operator*() const { return *_ptr; }
    [[nodiscard]] U* operator->() const { return _ptr; }

    basic_iterator& operator++()
    {
        ++_ptr;
        if (_ptr == _gap_begin)
            _ptr = _gap_end;
        return *this;
    }
    basic_iterator operator++(int)
    {
        auto const result = *this;
        ++*this;
        return result;
    }

    basic_iterator& operator--()
    {
        if (_ptr == _gap_end)
            _ptr = _gap_begin;
        --_ptr;
        return *this;
    }
    basic_iterator operator--(int)
    {
        auto const result = *this;
        --*this;
        return result;
    }

    [[nodiscard]] friend bool operator==(basic_iterator const& lhs, basic_iterator const& rhs)
    {
        return lhs._ptr == rhs._ptr;
    }

private:
    basic_iterator(U* ptr, U* gap_begin, U* gap_end) : _ptr(ptr), _gap_begin(gap_begin), _gap_end(gap_end) {}

    U* _ptr = nullptr;
    U* _gap_begin = nullptr;
    U* _gap_end = nullptr;

    friend struct gap_buffer<T>;
};
