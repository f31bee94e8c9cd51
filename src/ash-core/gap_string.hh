#pragma once

#include <ash-core/allocation.hh>
#include <ash-core/fwd.hh>
#include <ash-core/gap_buffer.hh>
#include <ash-core/optional.hh>
#include <ash-core/string_view.hh>
#include <ash-core/utf8.hh>

/// Growable UTF-8 text buffer with a movable gap, built on gap_buffer<char>.
///
/// Invariant: the front region and the back region are *each* valid UTF-8.
/// The gap therefore always sits on a char boundary, and front() / back() can be handed out as
/// string_views without re-validation. Every mutating operation either re-establishes the invariant
/// or fails (fatally, before mutating anything).
///
/// Indices and lengths are in bytes, not code points.
/// Index arguments that would split a multi-byte encoding are contract violations:
///   set_gap        -> "index is not on a char boundary"
///   truncate_*     -> "len is not on a char boundary"
///
/// Usage:
///   auto s = ash::gap_string::create_copy_of("that will be £5 please");
///   s.set_gap(15);          // front: "that will be £", back: "5 please"
///   s.push(U'0');           // front: "that will be £0", back: "5 please"
///   s.set_gap(14);          // fatal: inside the two bytes of '£'
///
/// The memory resource is sticky, as for gap_buffer.
struct ash::gap_string
{
    // construction
public:
    /// Empty string, no allocation.
    gap_string() = default;

    /// Empty string, no allocation, all future allocations use `resource`.
    explicit gap_string(memory_resource const* resource) : _bytes(resource) {}

    /// Empty string whose gap can hold `capacity` bytes.
    [[nodiscard]] static gap_string create_with_capacity(isize capacity, memory_resource const* resource = nullptr);

    /// Tight copy of `source` as the front region.
    /// Fatal ("string is not valid UTF-8") if source is not valid UTF-8.
    [[nodiscard]] static gap_string create_copy_of(string_view source, memory_resource const* resource = nullptr);

    /// Adopts `bytes` if both its regions are valid UTF-8, otherwise returns an empty optional
    /// (and `bytes` is left untouched).
    [[nodiscard]] static optional<gap_string> try_create_from_bytes(gap_buffer<char>&& bytes);

    /// Adopts the block of `alloc` without copying, its live window becomes the front region.
    /// Fatal ("string is not valid UTF-8") if the live window is not valid UTF-8.
    [[nodiscard]] static gap_string create_from_allocation(allocation<char>&& alloc);

    // insertion
public:
    /// Appends the UTF-8 encoding (1 to 4 bytes) of c to the front region.
    /// Fatal ("invalid unicode scalar value") for surrogates and values beyond 0x10FFFF.
    void push(char32_t c);

    /// Prepends the UTF-8 encoding of c to the back region.
    void push_back(char32_t c);

    /// Appends s to the front region.
    /// Fatal ("string is not valid UTF-8") if s is not valid UTF-8.
    void push_str(string_view s);

    /// Prepends s to the back region; afterwards back() starts with s.
    void push_str_back(string_view s);

    // removal
public:
    /// Removes and returns the last char of the front region, empty if there is none.
    [[nodiscard]] optional<char32_t> pop();

    /// Removes and returns the first char of the back region, empty if there is none.
    [[nodiscard]] optional<char32_t> pop_back();

    /// Shortens the front region to at most `len` bytes, dropping from its end.
    /// Fatal ("len is not on a char boundary") if the cut would split a char.
    void truncate_front(isize len);

    /// Shortens the back region to at most `len` bytes, dropping from its start.
    /// Fatal ("len is not on a char boundary") if the cut would split a char.
    void truncate_back(isize len);

    void clear() { _bytes.clear(); }

    // gap
public:
    /// Moves the gap to byte index `index`.
    /// Fatal ("index out of bounds") if index > size(),
    /// fatal ("index is not on a char boundary") if index splits a char.
    void set_gap(isize index);

    /// True if splitting at byte index `index` does not divide a multi-byte encoding.
    /// Always true at 0 and size(), false for indices outside [0, size()].
    [[nodiscard]] bool is_char_boundary(isize index) const;

    // access
public:
    /// Text before the gap.
    [[nodiscard]] string_view front() const
    {
        auto const s = _bytes.front();
        return string_view(s.data(), s.size());
    }

    /// Text after the gap.
    [[nodiscard]] string_view back() const
    {
        auto const s = _bytes.back();
        return string_view(s.data(), s.size());
    }

    /// Calls f(byte_index, c) for each char in logical order, across the gap.
    /// Byte indices of back region chars are offset by front_size().
    template <class F>
    void for_each_char(F&& f) const
    {
        decode_each(front(), 0, f);
        decode_each(back(), front_size(), f);
    }

    /// Like for_each_char, but from the last char to the first.
    template <class F>
    void for_each_char_reverse(F&& f) const
    {
        decode_each_reverse(back(), front_size(), f);
        decode_each_reverse(front(), 0, f);
    }

    /// Underlying bytes, read-only (mutable access would break the UTF-8 invariant).
    [[nodiscard]] gap_buffer<char> const& bytes() const { return _bytes; }

    // capacity
public:
    void reserve(isize additional) { _bytes.reserve(additional); }
    void shrink_to_fit() { _bytes.shrink_to_fit(); }

    /// Fatal ("capacity smaller than length") if capacity < size().
    void shrink_to(isize capacity) { _bytes.shrink_to(capacity); }

    // export
public:
    /// Hands out front then back as one tightly sized allocation, leaves this string empty.
    /// The live window is valid UTF-8 because both regions are.
    [[nodiscard]] allocation<char> extract_allocation() { return _bytes.extract_allocation(); }

    /// Like extract_allocation(), copying only if `resource` differs from this string's resource.
    [[nodiscard]] allocation<char> extract_allocation(memory_resource const* resource)
    {
        return _bytes.extract_allocation(resource);
    }

    // queries
public:
    /// Length in bytes.
    [[nodiscard]] isize size() const { return _bytes.size(); }
    [[nodiscard]] bool empty() const { return _bytes.empty(); }
    [[nodiscard]] isize front_size() const { return _bytes.front_size(); }
    [[nodiscard]] isize back_size() const { return _bytes.back_size(); }
    [[nodiscard]] isize capacity() const { return _bytes.capacity(); }

    // helper
private:
    template <class F>
    static void decode_each(string_view s, isize offset, F& f)
    {
        isize i = 0;
        while (i < s.size())
        {
            auto const d = ash::decode_utf8_first(s.subview(i));
            f(offset + i, d.value);
            i += d.size;
        }
    }

    template <class F>
    static void decode_each_reverse(string_view s, isize offset, F& f)
    {
        isize end = s.size();
        while (end > 0)
        {
            auto const d = ash::decode_utf8_last(s.subview(0, end));
            end -= d.size;
            f(offset + end, d.value);
        }
    }

    // members
private:
    gap_buffer<char> _bytes;
};
