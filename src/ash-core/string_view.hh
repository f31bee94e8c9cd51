#pragma once

#include <ash-core/assert.hh>
#include <ash-core/fwd.hh>

#include <concepts>

/// Non-owning view over a contiguous sequence of char, interpreted as UTF-8.
/// Stores char const* data and isize size.
/// gap_string::front() / back() hand out their regions as string_views.
///
/// WARNING: string_view does NOT guarantee a trailing null terminator.
/// The regions of a gap_string are never null-terminated.
struct ash::string_view
{
    // construction
public:
    /// Default string_view is empty: data() == nullptr, size() == 0.
    constexpr string_view() = default;

    /// Prevent construction from nullptr (compile-time error instead of runtime crash).
    string_view(nullptr_t) = delete;

    // keep triviality
    constexpr string_view(string_view const&) = default;
    constexpr string_view(string_view&&) = default;
    constexpr string_view& operator=(string_view const&) = default;
    constexpr string_view& operator=(string_view&&) = default;
    constexpr ~string_view() = default;

    /// Creates a string_view viewing [ptr, ptr+size).
    /// Precondition: size >= 0, and ptr must not be null unless size == 0.
    constexpr explicit string_view(char const* ptr, isize size) : _data(ptr), _size(size)
    {
        ASH_ASSERT(size >= 0, "string_view size must be non-negative");
        ASH_ASSERT(ptr != nullptr || size == 0, "null pointer only allowed for empty range");
    }

    /// Creates a string_view from a null-terminated C string.
    /// The resulting view does NOT include the null terminator.
    constexpr string_view(char const* cstr)
    {
        ASH_ASSERT(cstr != nullptr, "string_view cannot be constructed from nullptr");
        _data = cstr;
        _size = compute_length(cstr);
    }

    /// Creates a string_view from a null-terminated C string literal.
    /// The resulting view excludes the null terminator: size() == N - 1.
    /// CAUTION: for char buffers holding a shorter string, use string_view(ptr, size) instead.
    template <isize N>
    constexpr string_view(char const (&arr)[N]) : _data(arr), _size(N - 1)
    {
        static_assert(N > 0, "string literal must have at least a null terminator");
    }

    /// Creates a string_view from any container providing .data() and .size(), e.g. std::string.
    template <class Container>
        requires requires(Container&& c) {
            { c.data() } -> std::convertible_to<char const*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr string_view(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr char operator[](isize i) const
    {
        ASH_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    /// WARNING: The pointed-to data is NOT guaranteed to be null-terminated.
    [[nodiscard]] constexpr char const* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr char const* begin() const { return _data; }
    [[nodiscard]] constexpr char const* end() const { return _data + _size; }

    // queries
public:
    /// Returns the number of bytes in the string_view.
    /// This is the byte length, not the number of UTF-8 code points.
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // substring operations
public:
    /// Returns a subview starting at offset with the specified size.
    /// Precondition: 0 <= offset, 0 <= size, offset + size <= size().
    [[nodiscard]] constexpr string_view subview(isize offset, isize size) const
    {
        ASH_ASSERT(0 <= offset && offset <= _size, "subview offset out of range");
        ASH_ASSERT(0 <= size && offset + size <= _size, "subview range out of bounds");
        return string_view(_data + offset, size);
    }

    /// Returns a subview starting at offset to the end of the string.
    [[nodiscard]] constexpr string_view subview(isize offset) const
    {
        ASH_ASSERT(0 <= offset && offset <= _size, "subview offset out of range");
        return string_view(_data + offset, _size - offset);
    }

    [[nodiscard]] constexpr bool starts_with(string_view prefix) const
    {
        return prefix._size <= _size && subview(0, prefix._size) == prefix;
    }

    [[nodiscard]] constexpr bool ends_with(string_view suffix) const
    {
        return suffix._size <= _size && subview(_size - suffix._size) == suffix;
    }

    // comparison operators (hidden friends)
public:
    [[nodiscard]] friend constexpr bool operator==(string_view lhs, string_view rhs)
    {
        if (lhs._size != rhs._size)
            return false;
        for (isize i = 0; i < lhs._size; ++i)
        {
            if (lhs._data[i] != rhs._data[i])
                return false;
        }
        return true;
    }

    [[nodiscard]] friend constexpr bool operator!=(string_view lhs, string_view rhs) { return !(lhs == rhs); }

    // members
private:
    static constexpr isize compute_length(char const* cstr)
    {
        isize len = 0;
        while (cstr[len] != '\0')
            ++len;
        return len;
    }

    char const* _data = nullptr;
    isize _size = 0;
};
