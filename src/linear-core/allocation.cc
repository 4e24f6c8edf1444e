#include "allocation.hh"

#include <linear-core/assertf.hh>
#include <linear-core/macros.hh>
#include <linear-core/utility.hh>

#include <cstdlib>

namespace
{
// The system allocator is stateless, userdata is ignored throughout.

lc::isize system_allocate_bytes(lc::byte** out_ptr, lc::isize min_bytes, lc::isize max_bytes, lc::isize alignment, void* userdata)
{
    LC_UNUSED(max_bytes);
    LC_UNUSED(userdata);

    LC_ASSERT(out_ptr != nullptr, "out_ptr must not be null");
    LC_ASSERT(alignment > 0 && lc::is_power_of_two(alignment), "alignment must be a power of 2");
    LC_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    lc::byte* p = nullptr;

#ifdef LC_OS_WINDOWS
    p = static_cast<lc::byte*>(_aligned_malloc(min_bytes, alignment));
#else
    // posix_memalign has no bytes % alignment == 0 requirement (unlike std::aligned_alloc)
    // but needs alignment >= sizeof(void*)
    void* raw_ptr = nullptr;
    lc::isize const effective_alignment = alignment < lc::isize(sizeof(void*)) ? lc::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, size_t(effective_alignment), size_t(min_bytes));
    p = result == 0 ? static_cast<lc::byte*>(raw_ptr) : nullptr;
#endif

    // running out of memory is not recoverable for the containers
    LC_ASSERTF_ALWAYS(p != nullptr, "allocation failed: requested {} bytes with alignment {}", min_bytes, alignment);

    *out_ptr = p;
    return min_bytes;
}

void system_deallocate_bytes(lc::byte* p, lc::isize bytes, lc::isize alignment, void* userdata)
{
    LC_UNUSED(bytes);
    LC_UNUSED(alignment);
    LC_UNUSED(userdata);

#ifdef LC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

lc::isize system_try_resize_bytes_in_place(lc::byte* p,
                                           lc::isize old_bytes,
                                           lc::isize min_bytes,
                                           lc::isize max_bytes,
                                           lc::isize alignment,
                                           void* userdata)
{
    LC_UNUSED(userdata);

    LC_ASSERT(p != nullptr, "cannot resize null pointer");
    LC_ASSERT(alignment > 0 && lc::is_power_of_two(alignment), "alignment must be a power of 2");
    LC_ASSERT(old_bytes > 0, "old_bytes must be positive");
    LC_ASSERT(1 <= min_bytes && min_bytes <= max_bytes, "must have 1 <= min_bytes <= max_bytes");

    // shrinking "in place" is always possible: we simply stop using the tail
    // free() does not need the size, so the shorter canonical size is fine
    if (max_bytes <= old_bytes)
        return max_bytes;

    // malloc cannot grow without moving
    return -1;
}

constinit lc::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .try_resize_bytes_in_place = system_try_resize_bytes_in_place,
    .userdata = nullptr,
};

} // namespace

constinit lc::memory_resource const* const lc::default_memory_resource = &system_memory_resource;
