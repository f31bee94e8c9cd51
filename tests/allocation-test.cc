#include <ash-core/allocation.hh>
#include <ash-core/span.hh>
#include <ash-core/utility.hh>

#include "util/assertion-capture.hh"
#include "util/counting-resource.hh"

#include <nexus/test.hh>

#include <cstdint>

static_assert(!std::is_copy_constructible_v<ash::allocation<int>>);
static_assert(std::is_nothrow_move_constructible_v<ash::allocation<int>>);

TEST("memory_resource - default resource")
{
    REQUIRE(ash::default_memory_resource != nullptr);
    auto const& res = *ash::default_memory_resource;
    CHECK(&ash::resolve_memory_resource(nullptr) == &res);

    SECTION("zero bytes yield nullptr")
    {
        CHECK(res.allocate_bytes(0, 8, res.userdata) == nullptr);
        CHECK(res.try_allocate_bytes(0, 8, res.userdata) == nullptr);
    }

    SECTION("alignment is honored")
    {
        for (ash::isize alignment : {1, 2, 8, 16, 64, 256})
        {
            auto* const p = res.allocate_bytes(24, alignment, res.userdata);
            REQUIRE(p != nullptr);
            CHECK(reinterpret_cast<std::uintptr_t>(p) % std::uintptr_t(alignment) == 0);
            res.deallocate_bytes(p, 24, alignment, res.userdata);
        }
    }

    SECTION("in-place resize is refused")
    {
        auto* const p = res.allocate_bytes(16, 8, res.userdata);
        CHECK(res.try_resize_bytes_in_place(p, 16, 32, 32, 8, res.userdata) == -1);
        res.deallocate_bytes(p, 16, 8, res.userdata);
    }
}

TEST("allocation - default construction")
{
    ash::allocation<int> alloc;

    CHECK(!alloc.is_valid());
    CHECK(alloc.obj_span().empty());
    CHECK(alloc.alloc_size_bytes() == 0);
    CHECK(&alloc.resource() == ash::default_memory_resource);
}

TEST("allocation - create_empty")
{
    test::counting_resource res;

    SECTION("room without live elements")
    {
        auto alloc = ash::allocation<int>::create_empty(10, res.get());
        CHECK(alloc.is_valid());
        CHECK(alloc.obj_span().empty());
        CHECK(reinterpret_cast<ash::byte*>(alloc.obj_start) == alloc.alloc_start);
        CHECK(alloc.alloc_size_bytes() == 10 * ash::isize(sizeof(int)));
        CHECK(alloc.alignment == ash::isize(alignof(int)));
        CHECK(res.allocations == 1);
    }

    SECTION("zero capacity does not call the resource")
    {
        auto alloc = ash::allocation<int>::create_empty(0, res.get());
        CHECK(!alloc.is_valid());
        CHECK(alloc.custom_resource == res.get());
        CHECK(res.allocations == 0);
    }

    SECTION("overflow is fatal")
    {
        auto const msg = test::assertion_message_of([&]
                                                    { auto a = ash::allocation<int>::create_empty(PTRDIFF_MAX / 2, res.get()); });
        CHECK(msg == "capacity overflows isize max");
        CHECK(res.allocations == 0);
    }

    CHECK(res.live_bytes == 0);
}

TEST("allocation - create_copy_of")
{
    int const values[] = {1, 2, 3, 4};
    auto alloc = ash::allocation<int>::create_copy_of(values);

    REQUIRE(alloc.obj_span().size() == 4);
    CHECK(alloc.obj_span()[0] == 1);
    CHECK(alloc.obj_span()[3] == 4);
    CHECK(alloc.obj_start != values);

    auto empty = ash::allocation<int>::create_copy_of({});
    CHECK(!empty.is_valid());
}

TEST("allocation - ownership")
{
    test::counting_resource res;

    SECTION("destruction frees exactly once")
    {
        {
            auto alloc = ash::allocation<char>::create_empty(16, res.get());
            auto moved = ash::move(alloc);
            CHECK(!alloc.is_valid());
            CHECK(moved.is_valid());
            CHECK(alloc.custom_resource == res.get());
        }
        CHECK(res.allocations == 1);
        CHECK(res.deallocations == 1);
    }

    SECTION("move assignment frees the previous block")
    {
        auto a = ash::allocation<char>::create_empty(16, res.get());
        auto b = ash::allocation<char>::create_empty(8, res.get());
        auto* const block = b.alloc_start;

        a = ash::move(b);
        CHECK(res.deallocations == 1);
        CHECK(a.alloc_start == block);
        CHECK(a.alloc_size_bytes() == 8);
    }

    CHECK(res.live_bytes == 0);
}
