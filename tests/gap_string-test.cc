#include <ash-core/gap_string.hh>

#include "util/assertion-capture.hh"
#include "util/counting-resource.hh"

#include <nexus/test.hh>

#include <random>
#include <string>
#include <utility>
#include <vector>

namespace
{
constexpr char const* price = "that will be \xC2\xA3" "5 please"; // "that will be £5 please", 23 bytes

std::string to_string(ash::gap_string const& s)
{
    auto const front = s.front();
    auto const back = s.back();
    return std::string(front.data(), front.size()) + std::string(back.data(), back.size());
}
} // namespace

TEST("gap_string - default construction")
{
    ash::gap_string s;

    CHECK(s.empty());
    CHECK(s.size() == 0);
    CHECK(s.capacity() == 0);
    CHECK(s.front() == "");
    CHECK(s.back() == "");
    CHECK(!s.pop().has_value());
    CHECK(!s.pop_back().has_value());
    CHECK(s.is_char_boundary(0));
    CHECK(!s.is_char_boundary(1));
}

TEST("gap_string - push and pop")
{
    SECTION("mixed widths")
    {
        auto s = ash::gap_string();

        s.push(U'£');
        s.push_str("ab");
        s.push(U'c');
        CHECK(s.size() == 5);

        CHECK(s.pop() == U'c');
        CHECK(s.pop() == U'b');
        CHECK(s.pop() == U'a');
        CHECK(s.pop() == U'£');
        CHECK(s.pop() == ash::nullopt);
    }

    SECTION("back region")
    {
        auto s = ash::gap_string();

        s.push_back(U'a');
        s.push_back(U'£');
        s.push_back(U'b');
        CHECK(s.back() == "b\xC2\xA3" "a");

        CHECK(s.pop_back() == U'b');
        CHECK(s.pop_back() == U'£');
        CHECK(s.pop_back() == U'a');
        CHECK(!s.pop_back().has_value());
    }

    SECTION("all encoding lengths")
    {
        auto s = ash::gap_string();
        s.push(U'$');          // 1 byte
        s.push(U'\u00A3');     // 2 bytes
        s.push(U'\u20AC');     // 3 bytes
        s.push(U'\U0001F600'); // 4 bytes
        CHECK(s.size() == 10);
        CHECK(s.front() == "$\xC2\xA3\xE2\x82\xAC\xF0\x9F\x98\x80");

        CHECK(s.pop() == U'\U0001F600');
        CHECK(s.pop() == U'\u20AC');
        CHECK(s.size() == 3);
    }

    SECTION("invalid scalar values are fatal")
    {
        auto s = ash::gap_string::create_copy_of("ok");

        CHECK(test::assertion_message_of([&] { s.push(char32_t(0xD800)); }) == "invalid unicode scalar value");
        CHECK(test::assertion_message_of([&] { s.push_back(char32_t(0x110000)); }) == "invalid unicode scalar value");
        CHECK(to_string(s) == "ok");
    }

    SECTION("invalid strings are fatal")
    {
        auto s = ash::gap_string::create_copy_of("ok");

        CHECK(test::assertion_message_of([&] { s.push_str("\xC2"); }) == "string is not valid UTF-8");
        CHECK(test::assertion_message_of([&] { s.push_str_back("\xA3"); }) == "string is not valid UTF-8");
        CHECK(to_string(s) == "ok");
    }
}

TEST("gap_string - push_str_back keeps the order")
{
    auto s = ash::gap_string();
    s.push_str("hello");
    s.push_str_back("world");
    s.push_str_back(", ");

    CHECK(s.front() == "hello");
    CHECK(s.back() == ", world");
    CHECK(to_string(s) == "hello, world");
}

TEST("gap_string - set_gap")
{
    auto s = ash::gap_string::create_copy_of(price);
    REQUIRE(s.size() == 23);

    SECTION("on char boundaries")
    {
        s.set_gap(15);
        CHECK(s.front() == "that will be \xC2\xA3");
        CHECK(s.back() == "5 please");

        s.set_gap(23);
        CHECK(s.front() == price);
        CHECK(s.back() == "");

        s.set_gap(0);
        CHECK(s.front() == "");
        CHECK(s.back() == price);
    }

    SECTION("inside a char is fatal")
    {
        s.set_gap(15);
        auto const msg = test::assertion_message_of([&] { s.set_gap(14); });

        CHECK(msg == "index is not on a char boundary");
        CHECK(s.front_size() == 15);
        CHECK(to_string(s) == price);
    }

    SECTION("out of bounds is fatal")
    {
        CHECK(test::assertion_message_of([&] { s.set_gap(24); }) == "index out of bounds");
        CHECK(test::assertion_message_of([&] { s.set_gap(-1); }) == "index out of bounds");
    }

    SECTION("empty string")
    {
        auto empty = ash::gap_string();
        empty.set_gap(0);
        CHECK(test::assertion_message_of([&] { empty.set_gap(1); }) == "index out of bounds");
    }

    SECTION("insertion at the gap")
    {
        s.set_gap(15);
        s.push(U'0');
        CHECK(s.front() == "that will be \xC2\xA3" "0");
        CHECK(s.back() == "5 please");
    }
}

TEST("gap_string - is_char_boundary")
{
    auto s = ash::gap_string::create_copy_of(price);
    s.set_gap(5);

    CHECK(s.is_char_boundary(0));
    CHECK(s.is_char_boundary(5));
    CHECK(s.is_char_boundary(13));
    CHECK(!s.is_char_boundary(14));
    CHECK(s.is_char_boundary(15));
    CHECK(s.is_char_boundary(23));
    CHECK(!s.is_char_boundary(24));
    CHECK(!s.is_char_boundary(-1));
}

TEST("gap_string - truncate")
{
    auto s = ash::gap_string::create_copy_of(price);

    SECTION("front")
    {
        s.truncate_front(23);
        CHECK(s.front() == price);

        s.truncate_front(15);
        CHECK(s.front() == "that will be \xC2\xA3");

        // beyond the front region clamps
        s.truncate_front(100);
        CHECK(s.front_size() == 15);

        s.truncate_front(0);
        CHECK(s.empty());
    }

    SECTION("front inside a char is fatal")
    {
        auto const msg = test::assertion_message_of([&] { s.truncate_front(14); });
        CHECK(msg == "len is not on a char boundary");
        CHECK(s.front() == price);
    }

    SECTION("back")
    {
        s.set_gap(0);

        s.truncate_back(23);
        CHECK(s.back() == price);

        s.truncate_back(8);
        CHECK(s.back() == "5 please");

        s.truncate_back(0);
        CHECK(s.empty());
    }

    SECTION("back inside a char is fatal")
    {
        s.set_gap(0);

        auto const msg = test::assertion_message_of([&] { s.truncate_back(9); });
        CHECK(msg == "len is not on a char boundary");
        CHECK(s.back() == price);
    }

    SECTION("clear keeps the capacity")
    {
        auto const capacity = s.capacity();
        s.clear();
        CHECK(s.empty());
        CHECK(s.capacity() == capacity);
    }
}

TEST("gap_string - for_each_char")
{
    auto s = ash::gap_string();
    s.push_str("hello");
    s.push_str_back(" \xC2\xA3world");

    std::vector<std::pair<ash::isize, char32_t>> chars;
    s.for_each_char([&](ash::isize index, char32_t c) { chars.emplace_back(index, c); });

    std::u32string const expected = U"hello £world";
    REQUIRE(chars.size() == expected.size());

    ash::isize byte_index = 0;
    for (size_t i = 0; i < chars.size(); ++i)
    {
        CHECK(chars[i].first == byte_index);
        CHECK(chars[i].second == expected[i]);
        byte_index += ash::utf8_encoded_size(expected[i]);
    }

    CHECK(chars.back().first == 12);
    CHECK(chars.back().second == U'd');
}

TEST("gap_string - for_each_char_reverse")
{
    auto s = ash::gap_string();
    s.push_str("hello");
    s.push_str_back(" \xC2\xA3world");

    std::vector<std::pair<ash::isize, char32_t>> forward;
    s.for_each_char([&](ash::isize index, char32_t c) { forward.emplace_back(index, c); });

    std::vector<std::pair<ash::isize, char32_t>> reverse;
    s.for_each_char_reverse([&](ash::isize index, char32_t c) { reverse.emplace_back(index, c); });

    REQUIRE(!reverse.empty());
    CHECK(reverse.front().first == 12);
    CHECK(reverse.front().second == U'd');
    CHECK(reverse.back().first == 0);
    CHECK(reverse.back().second == U'h');
    CHECK(std::vector(reverse.rbegin(), reverse.rend()) == forward);

    SECTION("gap inside the text")
    {
        s.set_gap(6);
        std::u32string chars;
        s.for_each_char_reverse([&](ash::isize, char32_t c) { chars += c; });
        CHECK(chars == U"dlrow£ olleh");
    }

    SECTION("empty string")
    {
        auto empty = ash::gap_string();
        auto calls = 0;
        empty.for_each_char_reverse([&](ash::isize, char32_t) { ++calls; });
        CHECK(calls == 0);
    }
}

TEST("gap_string - construction from bytes")
{
    SECTION("valid bytes")
    {
        auto bytes = ash::gap_buffer<char>();
        bytes.push_slice({'a', '\xC2', '\xA3'});
        bytes.push_slice_back({'b'});

        auto s = ash::gap_string::try_create_from_bytes(ash::move(bytes));
        REQUIRE(s.has_value());
        CHECK(s.value().front() == "a\xC2\xA3");
        CHECK(s.value().back() == "b");
        CHECK(bytes.empty());
    }

    SECTION("invalid bytes leave the input untouched")
    {
        auto bytes = ash::gap_buffer<char>();
        bytes.push_slice({'a', '\xC2'});
        bytes.push_slice_back({'\xA3'});

        // each region must be valid on its own
        auto s = ash::gap_string::try_create_from_bytes(ash::move(bytes));
        CHECK(!s.has_value());
        CHECK(bytes.size() == 3);
    }

    SECTION("invalid copy is fatal")
    {
        auto const msg = test::assertion_message_of([] { auto s = ash::gap_string::create_copy_of("\xFF"); });
        CHECK(msg == "string is not valid UTF-8");
    }

    SECTION("bytes() exposes the underlying buffer")
    {
        auto s = ash::gap_string::create_copy_of("ab");
        s.set_gap(1);
        CHECK(s.bytes().front_size() == 1);
        CHECK(s.bytes()[1] == 'b');
    }
}

TEST("gap_string - allocations")
{
    test::counting_resource res;

    SECTION("round trip through an allocation")
    {
        auto s = ash::gap_string(res.get());
        s.push_str("hello");
        s.push_str_back(" world");

        auto alloc = s.extract_allocation();
        CHECK(s.empty());
        CHECK(alloc.obj_end - alloc.obj_start == 11);
        CHECK(alloc.alloc_size_bytes() == 11);
        CHECK(alloc.custom_resource == res.get());

        // one block for the pushes, one for the tight copy, none for the adoption
        auto again = ash::gap_string::create_from_allocation(ash::move(alloc));
        CHECK(again.front() == "hello world");
        CHECK(again.back() == "");
        CHECK(again.capacity() == 11);
        CHECK(res.allocations == 2);
    }

    SECTION("invalid allocation is fatal")
    {
        auto alloc = ash::allocation<char>::create_copy_of({'\xC2'}, res.get());

        auto const msg = test::assertion_message_of([&] { auto s = ash::gap_string::create_from_allocation(ash::move(alloc)); });
        CHECK(msg == "string is not valid UTF-8");
        CHECK(alloc.is_valid());
    }

    SECTION("extraction into another resource copies")
    {
        auto s = ash::gap_string::create_copy_of("abc");
        auto alloc = s.extract_allocation(res.get());

        CHECK(res.allocations == 1);
        CHECK(alloc.custom_resource == res.get());
        CHECK(alloc.alloc_size_bytes() == 3);
    }

    SECTION("reserve and shrink")
    {
        auto s = ash::gap_string::create_with_capacity(4, res.get());
        s.reserve(10);
        CHECK(s.capacity() == 68);

        s.push_str("abc");
        s.shrink_to(5);
        CHECK(s.capacity() == 5);
        s.shrink_to_fit();
        CHECK(s.capacity() == 3);
        CHECK(s.front() == "abc");

        CHECK(test::assertion_message_of([&] { s.shrink_to(2); }) == "capacity smaller than length");
    }

    CHECK(res.live_bytes == 0);
}

TEST("gap_string - copy and move")
{
    auto s = ash::gap_string::create_copy_of(price);
    s.set_gap(15);

    auto copy = s;
    CHECK(copy.front() == s.front());
    CHECK(copy.back() == s.back());
    CHECK(copy.front().data() != s.front().data());

    copy.push(U'0');
    CHECK(s.front_size() == 15);

    auto moved = ash::move(s);
    CHECK(to_string(moved) == price);
    CHECK(s.empty());
    CHECK(s.capacity() == 0);
}

TEST("gap_string - random edits keep both regions valid UTF-8")
{
    std::mt19937 rng(1337);
    auto pick = [&](ash::isize lo, ash::isize hi) { return std::uniform_int_distribution<ash::isize>(lo, hi)(rng); };

    char32_t const alphabet[] = {U'a', U'Z', U'~', U'\u00A3', U'\u00E9', U'\u20AC', U'\uFFFD', U'\U0001F600', U'\U0010FFFF'};
    auto random_char = [&] { return alphabet[pick(0, ash::isize(std::size(alphabet)) - 1)]; };

    // byte length of model[begin, end)
    auto byte_size = [](std::u32string const& chars, size_t begin, size_t end)
    {
        ash::isize n = 0;
        for (auto i = begin; i < end; ++i)
            n += ash::utf8_encoded_size(chars[i]);
        return n;
    };

    auto s = ash::gap_string();
    std::u32string model;
    size_t gap = 0;

    for (auto step = 0; step < 3000; ++step)
    {
        auto const back_len = model.size() - gap;

        switch (pick(0, 9))
        {
        case 0:
        case 1:
        {
            auto const c = random_char();
            s.push(c);
            model.insert(model.begin() + gap, c);
            ++gap;
            break;
        }
        case 2:
        {
            auto const c = random_char();
            s.push_back(c);
            model.insert(model.begin() + gap, c);
            break;
        }
        case 3:
        case 4:
        {
            std::u32string chars;
            std::string bytes;
            for (auto i = pick(0, 6); i > 0; --i)
            {
                char enc[4];
                chars += random_char();
                bytes.append(enc, size_t(ash::encode_utf8(chars.back(), enc)));
            }

            if (step % 2 == 0)
            {
                s.push_str(bytes);
                model.insert(gap, chars);
                gap += chars.size();
            }
            else
            {
                s.push_str_back(bytes);
                model.insert(gap, chars);
            }
            break;
        }
        case 5:
        {
            auto const c = s.pop();
            if (gap == 0)
                CHECK(c == ash::nullopt);
            else
            {
                CHECK(c == model[gap - 1]);
                model.erase(gap - 1, 1);
                --gap;
            }
            break;
        }
        case 6:
        {
            auto const c = s.pop_back();
            if (back_len == 0)
                CHECK(c == ash::nullopt);
            else
            {
                CHECK(c == model[gap]);
                model.erase(gap, 1);
            }
            break;
        }
        case 7:
            gap = size_t(pick(0, ash::isize(model.size())));
            s.set_gap(byte_size(model, 0, gap));
            break;
        case 8:
        {
            auto const keep = size_t(pick(0, ash::isize(gap)));
            s.truncate_front(byte_size(model, 0, keep));
            model.erase(keep, gap - keep);
            gap = keep;
            break;
        }
        case 9:
        {
            auto const keep = size_t(pick(0, ash::isize(back_len)));
            s.truncate_back(byte_size(model, model.size() - keep, model.size()));
            model.erase(gap, back_len - keep);
            break;
        }
        }

        REQUIRE(ash::is_valid_utf8(s.front()));
        REQUIRE(ash::is_valid_utf8(s.back()));
        REQUIRE(s.front_size() == byte_size(model, 0, gap));
        REQUIRE(s.size() == byte_size(model, 0, model.size()));

        std::u32string chars;
        s.for_each_char([&](ash::isize, char32_t c) { chars += c; });
        REQUIRE(chars == model);
    }
}
