#pragma once

#include <linear-core/fwd.hh>
#include <linear-core/utility.hh>

#include <type_traits>

namespace lc::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
/// Trivially destructible types are optimized out at compile time.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Copy-constructs objects from [src_start, src_end) into uninitialized memory at dest_end.
/// dest_end is incremented for each successfully constructed object, so if a copy throws,
/// [original dest_end, dest_end) is exactly the constructed range that needs cleanup.
/// Trivially copyable types are copied with memcpy.
///
/// Usage pattern:
///   auto obj_end = obj_start;
///   copy_create_objects_to(obj_end, src, src + count);
///   // [obj_start, obj_end) is now the constructed live range
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            lc::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (lc::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end) into uninitialized memory at dest_end.
/// Same T*& dest_end convention as copy_create_objects_to.
/// The source objects stay alive (moved-from) and must still be destroyed by the caller.
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            lc::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (lc::placement_new, dest_end) T(lc::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs [src_start, src_end) in reverse order into the uninitialized memory that ends at dest_start.
/// dest_start is decremented after each successful construction, so it always marks the start of
/// the constructed range. Used by growth: the new element is built first, the old ones are moved in front of it.
template <class T>
constexpr void move_create_objects_to_reverse(T*& dest_start, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            dest_start -= size;
            lc::memcpy(dest_start, src_start, size * sizeof(T));
        }
    }
    else
    {
        while (src_start != src_end)
        {
            --src_end;
            new (lc::placement_new, dest_start - 1) T(lc::move(*src_end));
            --dest_start; // _after_ construction so exceptions leave dest_start pointing to the constructed range
        }
    }
}

/// Move-assigns the alive objects [src_start, src_end) one slot at a time to the front, starting at dest.
/// Precondition: dest < src_start and every slot in [dest, src_end) is alive.
/// Afterwards [dest, dest + (src_end - src_start)) holds the values and the trailing slots are moved-from
/// but still alive. Order is preserved. This is the compaction step of ordered removal.
template <class T>
constexpr void compact_move_objects_backward(T* dest, T* src_start, T* src_end)
{
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable");
    LC_ASSERT(dest <= src_start, "compaction must move towards the front");

    while (src_start != src_end)
    {
        *dest = lc::move(*src_start);
        ++dest;
        ++src_start;
    }
}

/// Order-preserving in-place filter over the alive range [start, end).
/// Keeps exactly the objects for which keep(obj) returns true, compacting them to the front.
/// keep is called exactly once per object, in order, and may modify the object.
/// Returns the new end; the objects in [new_end, end) are moved-from but still alive.
/// If keep throws, all objects remain alive (some possibly moved-from) so the range stays destructible.
template <class T, class KeepF>
constexpr T* compact_retain_objects(T* start, T* end, KeepF&& keep)
{
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable");

    // skip the common prefix that is kept without moving anything
    while (start != end && keep(*start))
        ++start;

    if (start == end)
        return end;

    T* dest = start;
    for (auto it = start + 1; it != end; ++it)
    {
        if (keep(*it))
        {
            *dest = lc::move(*it);
            ++dest;
        }
    }
    return dest;
}
} // namespace lc::impl
