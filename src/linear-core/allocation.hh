#pragma once

#include <linear-core/fwd.hh>
#include <linear-core/impl/object_lifetime_util.hh>
#include <linear-core/span.hh>
#include <linear-core/utility.hh>

// lc::allocation<T> is the owning "storage + liveness" handle underneath lc::vector<T>,
// and therefore underneath every map and set, which keep their entries in a vector.
//
// It models two things explicitly:
// 1) which bytes are owned (the allocation from an lc::memory_resource),
// 2) which objects inside those bytes are currently alive (the live window).
//
// Memory is obtained from a polymorphic lc::memory_resource (POD, function-pointer based, static-init safe).
// The resource pointer is stored in the allocation, not as a template argument. A null resource
// means "use lc::default_memory_resource". Maps with different resources are still the same type.
//
// Core invariants:
// - [alloc_start, alloc_end) is the owned byte range (exclusive end).
// - [obj_start, obj_end) is the live object range (exclusive end), always within the allocation.
// - obj_start and obj_end are always aligned to alignof(T), even when empty.
// - custom_resource == nullptr implies use of lc::default_memory_resource.

namespace lc
{
/// Default memory resource used when allocation::custom_resource == nullptr.
/// A system allocator stored in the data segment, valid even during static initialization.
extern lc::memory_resource const* const default_memory_resource;
} // namespace lc

/// Polymorphic memory resource interface powering lc::allocation<T>.
/// Custom allocators implement this interface by filling in the function pointers.
/// POD with function pointers to avoid virtual dispatch and non-trivial constructors.
struct lc::memory_resource
{
    /// Allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size, which will be in [min_bytes, max_bytes].
    /// The allocated pointer is stored in `*out_ptr`.
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// min_bytes > 0 always sets *out_ptr to non-null; failure is fatal.
    lc::function_ptr<isize(lc::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> allocate_bytes
        = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    /// `bytes` and `alignment` must match the values of the allocation.
    lc::function_ptr<void(lc::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// Attempt to resize an existing allocation in place without moving or freeing it.
    /// Returns the new size in [min_bytes, max_bytes] on success, or -1 on failure.
    /// On failure the allocation stays valid and unchanged at `p`.
    /// Unlike realloc this never moves: map::insert(k, m[k2]) style aliasing stays safe during growth.
    /// May be nullptr if the resource never resizes in place.
    lc::function_ptr<isize(lc::byte* p, isize old_bytes, isize min_bytes, isize max_bytes, isize alignment, void* userdata)>
        try_resize_bytes_in_place = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};

/// Owning allocation handle for a contiguous byte block plus a typed "live window" inside it.
///
/// Invariants:
/// - alloc_start <= obj_start <= obj_end <= alloc_end (even for empty ranges or empty allocations).
/// - size() is (obj_end - obj_start) in elements.
/// - resource == nullptr means the global default memory resource is used.
template <class T>
struct lc::allocation
{
    /// Pointer to the first live object.
    T* obj_start = nullptr;

    /// Pointer one past the last live object (exclusive end).
    T* obj_end = nullptr;

    /// Start of the owned byte allocation (base pointer returned by the memory resource).
    lc::byte* alloc_start = nullptr;

    /// End of the owned byte allocation (exclusive).
    lc::byte* alloc_end = nullptr;

    /// Alignment that was used when allocating [alloc_start, alloc_end).
    /// Needed again for deallocation.
    isize alignment = 0;

    /// Memory resource that owns the allocation, or nullptr for the global default.
    /// Kept across moves and clears so that later growth uses the same resource.
    lc::memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    [[nodiscard]] lc::memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    /// True iff this owns bytes (alloc_start < alloc_end)
    /// obj_span might still be empty
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    /// Returns the span of live objects
    /// Note: proper mutability ("const correctness") is user responsibility
    [[nodiscard]] lc::span<T> obj_span() const { return lc::span<T>(obj_start, obj_end); }

    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    /// Attempt to resize the allocation in place to a size between min_bytes and max_bytes.
    /// Returns true on success (alloc_end updated), false otherwise (nothing changed).
    /// IMPORTANT: Cannot resize below the size needed by live objects (obj_end).
    [[nodiscard]] bool try_resize_alloc_inplace(isize min_bytes, isize max_bytes)
    {
        LC_ASSERT(min_bytes >= 0 && max_bytes >= min_bytes, "try_resize_alloc_inplace: invalid size range");

        isize const obj_end_bytes = (byte const*)obj_end - alloc_start;
        LC_ASSERT(min_bytes >= obj_end_bytes, "try_resize_alloc_inplace: cannot resize below live object range");

        if (alloc_start == nullptr || min_bytes == 0)
            return false;

        auto const& res = resource();
        if (res.try_resize_bytes_in_place == nullptr)
            return false;

        isize const new_bytes = res.try_resize_bytes_in_place(alloc_start, alloc_end - alloc_start, min_bytes,
                                                              max_bytes, alignment, res.userdata);
        if (new_bytes == -1)
            return false;

        LC_ASSERT(min_bytes <= new_bytes && new_bytes <= max_bytes, "memory resource violated the resize contract");
        alloc_end = alloc_start + new_bytes;
        return true;
    }

    /// Resize the allocation to a size between min_bytes and max_bytes.
    /// Tries in-place first. Otherwise allocates a new block, moves the live objects over,
    /// and releases the old block.
    /// IMPORTANT: Cannot resize below the size needed by live objects.
    void resize_alloc(isize min_bytes, isize max_bytes, isize new_alignment)
    {
        LC_ASSERT(min_bytes >= 0 && max_bytes >= min_bytes, "resize_alloc: invalid size range");
        LC_ASSERT(new_alignment >= isize(alignof(T)), "new_alignment must be at least alignof(T)");
        LC_ASSERT(min_bytes >= (obj_end - obj_start) * isize(sizeof(T)), "resize_alloc: cannot resize below live "
                                                                          "object range");

        // in-place only keeps obj_start where it is, which requires obj_start == alloc_start
        if ((byte*)obj_start == alloc_start && lc::is_aligned(alloc_start, new_alignment)
            && try_resize_alloc_inplace(min_bytes, max_bytes))
        {
            alignment = new_alignment;
            return;
        }

        auto new_alloc = allocation::create_empty_bytes(min_bytes, max_bytes, new_alignment, custom_resource);
        impl::move_create_objects_to(new_alloc.obj_end, obj_start, obj_end);

        // destroys the moved-from objects and the old block
        *this = lc::move(new_alloc);
    }

    // factories
public:
    /// Creates an empty allocation with reserved capacity but no live objects.
    ///
    /// Allocates between min_bytes and max_bytes with the specified alignment.
    /// The result has obj_start == obj_end == alloc_start.
    /// min_bytes == 0 results in nullptr with no real allocation call.
    [[nodiscard]] static allocation create_empty_bytes(isize min_bytes,
                                                       isize max_bytes, // NOLINT
                                                       isize alignment, // NOLINT
                                                       memory_resource const* resource)
    {
        LC_ASSERT(alignment >= isize(alignof(T)), "alignment must be at least alignof(T)");
        LC_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignment;

        if (min_bytes > 0)
        {
            auto const& res = resource ? *resource : *default_memory_resource;
            auto const actual_byte_size
                = res.allocate_bytes(&result.alloc_start, min_bytes, max_bytes, result.alignment, res.userdata);
            LC_ASSERT_ALWAYS(result.alloc_start != nullptr, "memory resource returned null for a non-empty request");
            LC_ASSERT(min_bytes <= actual_byte_size && actual_byte_size <= max_bytes,
                      "memory resource violated the allocation contract");
            result.alloc_end = result.alloc_start + actual_byte_size;
        }

        result.obj_start = (T*)result.alloc_start;
        result.obj_end = result.obj_start;
        return result;
    }

    /// Creates a tight deep copy of a span of objects using the specified memory resource.
    [[nodiscard]] static allocation create_copy_of(span<T const> source, isize alignment, memory_resource const* resource)
    {
        auto const byte_size = source.size() * isize(sizeof(T));
        auto result = allocation::create_empty_bytes(byte_size, byte_size, alignment, resource);
        impl::copy_create_objects_to(result.obj_end, source.data(), source.data() + source.size());
        return result;
    }

    // lifecycle
public:
    allocation() = default;

    // no implicit copies for allocations
    // lc::vector decides how to copy
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(lc::exchange(rhs.obj_start, nullptr)),
        obj_end(lc::exchange(rhs.obj_end, nullptr)),
        alloc_start(lc::exchange(rhs.alloc_start, nullptr)),
        alloc_end(lc::exchange(rhs.alloc_end, nullptr)),
        alignment(lc::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    /// Move assignment that stays correct when rhs lives inside one of our own objects,
    /// e.g. a map<int, map<int, int>> assigned from one of its own values.
    /// rhs is moved into a temporary first, so destroying our objects cannot free it twice.
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = lc::move(rhs);

            release();

            obj_start = lc::exchange(rhs_tmp.obj_start, nullptr);
            obj_end = lc::exchange(rhs_tmp.obj_end, nullptr);
            alloc_start = lc::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = lc::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = lc::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource;
        }

        return *this;
    }

    ~allocation() { release(); }

private:
    void release()
    {
        impl::destroy_objects_in_reverse(obj_start, obj_end);

        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
    }
};
