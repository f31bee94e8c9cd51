#pragma once

#include <ash-core/allocation.hh>

#include <map>

namespace test
{
/// Memory resource that counts calls and forwards to the default resource.
///
/// With in_place_slack > 0, every block is over-allocated by that many bytes and
/// try_resize_bytes_in_place succeeds as long as the request fits the real block.
/// This makes the in-place growth and shrink paths of the containers reachable in tests.
struct counting_resource
{
    int allocations = 0;
    int deallocations = 0;
    int in_place_resizes = 0;
    ash::isize live_bytes = 0;
    ash::isize in_place_slack = 0;

    ash::memory_resource resource = {
        .allocate_bytes = allocate,
        .try_allocate_bytes = allocate,
        .deallocate_bytes = deallocate,
        .try_resize_bytes_in_place = try_resize,
        .userdata = this,
    };

    counting_resource() = default;
    explicit counting_resource(ash::isize slack) : in_place_slack(slack) {}

    counting_resource(counting_resource const&) = delete;
    counting_resource& operator=(counting_resource const&) = delete;

    [[nodiscard]] ash::memory_resource const* get() const { return &resource; }

private:
    // real size of each block handed out
    std::map<ash::byte*, ash::isize> _blocks;

    static ash::byte* allocate(ash::isize bytes, ash::isize alignment, void* userdata)
    {
        if (bytes == 0)
            return nullptr;

        auto& self = *static_cast<counting_resource*>(userdata);
        auto const& sys = *ash::default_memory_resource;
        auto const real_bytes = bytes + self.in_place_slack;
        auto* const p = sys.allocate_bytes(real_bytes, alignment, sys.userdata);

        ++self.allocations;
        self.live_bytes += bytes;
        self._blocks[p] = real_bytes;
        return p;
    }

    static void deallocate(ash::byte* p, ash::isize bytes, ash::isize alignment, void* userdata)
    {
        auto& self = *static_cast<counting_resource*>(userdata);
        auto const& sys = *ash::default_memory_resource;
        auto const it = self._blocks.find(p);
        auto const real_bytes = it->second;
        self._blocks.erase(it);

        ++self.deallocations;
        self.live_bytes -= bytes;
        sys.deallocate_bytes(p, real_bytes, alignment, sys.userdata);
    }

    static ash::isize try_resize(ash::byte* p,
                                 ash::isize old_bytes,
                                 ash::isize min_bytes,
                                 ash::isize max_bytes,
                                 ash::isize alignment,
                                 void* userdata)
    {
        (void)max_bytes;
        (void)alignment;

        auto& self = *static_cast<counting_resource*>(userdata);
        if (self.in_place_slack == 0 || min_bytes > self._blocks.at(p))
            return -1;

        ++self.in_place_resizes;
        self.live_bytes += min_bytes - old_bytes;
        return min_bytes;
    }
};
} // namespace test
