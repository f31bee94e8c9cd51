#include "gap_string.hh"

#include <ash-core/assert.hh>

ash::gap_string ash::gap_string::create_with_capacity(isize capacity, memory_resource const* resource)
{
    gap_string result;
    result._bytes = gap_buffer<char>::create_with_capacity(capacity, resource);
    return result;
}

ash::gap_string ash::gap_string::create_copy_of(string_view source, memory_resource const* resource)
{
    ASH_ASSERT_ALWAYS(ash::is_valid_utf8(source), "string is not valid UTF-8");

    gap_string result;
    result._bytes = gap_buffer<char>::create_copy_of(span<char const>(source.data(), source.size()), resource);
    return result;
}

ash::optional<ash::gap_string> ash::gap_string::try_create_from_bytes(gap_buffer<char>&& bytes)
{
    auto const front = bytes.front();
    auto const back = bytes.back();
    if (!ash::is_valid_utf8(string_view(front.data(), front.size())) || !ash::is_valid_utf8(string_view(back.data(), back.size())))
        return nullopt;

    gap_string result;
    result._bytes = ash::move(bytes);
    return result;
}

ash::gap_string ash::gap_string::create_from_allocation(allocation<char>&& alloc)
{
    auto const live = alloc.obj_span();
    ASH_ASSERT_ALWAYS(ash::is_valid_utf8(string_view(live.data(), live.size())), "string is not valid UTF-8");

    gap_string result;
    result._bytes = gap_buffer<char>::create_from_allocation(ash::move(alloc));
    return result;
}

void ash::gap_string::push(char32_t c)
{
    ASH_ASSERT_ALWAYS(ash::is_unicode_scalar_value(c), "invalid unicode scalar value");

    char encoded[4];
    auto const n = ash::encode_utf8(c, encoded);
    _bytes.push_slice(span<char const>(encoded, n));
}

void ash::gap_string::push_back(char32_t c)
{
    ASH_ASSERT_ALWAYS(ash::is_unicode_scalar_value(c), "invalid unicode scalar value");

    char encoded[4];
    auto const n = ash::encode_utf8(c, encoded);
    _bytes.push_slice_back(span<char const>(encoded, n));
}

void ash::gap_string::push_str(string_view s)
{
    ASH_ASSERT_ALWAYS(ash::is_valid_utf8(s), "string is not valid UTF-8");
    _bytes.push_slice(span<char const>(s.data(), s.size()));
}

void ash::gap_string::push_str_back(string_view s)
{
    ASH_ASSERT_ALWAYS(ash::is_valid_utf8(s), "string is not valid UTF-8");
    _bytes.push_slice_back(span<char const>(s.data(), s.size()));
}

ash::optional<char32_t> ash::gap_string::pop()
{
    if (front_size() == 0)
        return nullopt;

    auto const d = ash::decode_utf8_last(front());
    _bytes.truncate_front(front_size() - d.size);
    return d.value;
}

ash::optional<char32_t> ash::gap_string::pop_back()
{
    if (back_size() == 0)
        return nullopt;

    auto const d = ash::decode_utf8_first(back());
    _bytes.truncate_back(back_size() - d.size);
    return d.value;
}

void ash::gap_string::truncate_front(isize len)
{
    ASH_ASSERT(len >= 0, "length must be non-negative");

    // the cut lands at byte `len` of the front region (or nowhere if len >= front_size)
    if (len < front_size())
        ASH_ASSERT_ALWAYS(ash::is_utf8_char_boundary(front()[len]), "len is not on a char boundary");

    _bytes.truncate_front(len);
}

void ash::gap_string::truncate_back(isize len)
{
    ASH_ASSERT(len >= 0, "length must be non-negative");

    // the back region keeps its last `len` bytes, so the cut lands at back_size - len
    // (len == 0 cuts at the end, which is always a boundary)
    if (0 < len && len < back_size())
        ASH_ASSERT_ALWAYS(ash::is_utf8_char_boundary(back()[back_size() - len]), "len is not on a char boundary");

    _bytes.truncate_back(len);
}

void ash::gap_string::set_gap(isize index)
{
    ASH_ASSERT_ALWAYS(0 <= index && index <= size(), "index out of bounds");
    ASH_ASSERT_ALWAYS(is_char_boundary(index), "index is not on a char boundary");

    _bytes.set_gap(index);
}

bool ash::gap_string::is_char_boundary(isize index) const
{
    if (index == size())
        return true;

    auto const* const b = _bytes.get(index);
    return b != nullptr && ash::is_utf8_char_boundary(*b);
}
