#pragma once

#include <linear-core/assert.hh>
#include <linear-core/fwd.hh>

#include <cstring> // std::memcpy
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//   min(a, b)                   - returns the smaller of two values (requires operator<)
//
// Alignment (value or pointer):
//   is_power_of_two(value)      - check if value is a power of 2
//   is_aligned(value, align)    - check if aligned at boundary (power of 2)
//
// Raw memory:
//   new (placement_new, ptr) T(...) - construct T in uninitialized storage
//   storage_for<T>                  - properly aligned, uninitialized storage for one T
//   memcpy(dst, src, bytes)         - byte copy with signed size
//
// Template metaprogramming:
//   function_ptr<Signature>     - convert function signature to function pointer type
//
// Iterator utilities:
//   sentinel                    - lightweight end-of-range sentinel type
//

namespace lc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   m.insert(lc::move(key), lc::move(value));
///   auto entries = lc::move(m).extract_entries();
template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   V old = lc::exchange(slot.second, lc::move(value));  // map::insert on an existing key
template <class T, class U = T>
[[nodiscard]] LC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (so that min and max never pick the same element)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Alignment (for values or pointers)
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    LC_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Check if value is aligned at the given boundary
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr bool is_aligned(T value, isize alignment)
{
    LC_ASSERT(alignment > 0 && is_power_of_two(alignment), "is_aligned: alignment must be a power of 2");
    return 0 == ((isize)value & (alignment - 1));
}

// =========================================================================================================
// Raw memory
// =========================================================================================================

namespace impl
{
struct placement_new_tag
{
};
} // namespace impl

/// Tag for our own placement new overload
/// Never shadowed by a class-level operator new of T
/// Usage:
///   new (lc::placement_new, slot) T(lc::forward<Args>(args)...);
[[maybe_unused]] constexpr impl::placement_new_tag placement_new;

/// Uninitialized, correctly aligned storage for exactly one T
/// The member is only alive after an explicit placement new and must be destroyed manually
/// Trivially copyable and destructible whenever T is
template <class T>
union storage_for
{
    storage_for() {}
    storage_for(storage_for const&) = default;
    storage_for& operator=(storage_for const&) = default;

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    T value;
};

/// Byte copy between non-overlapping ranges
LC_FORCE_INLINE void memcpy(void* dst, void const* src, isize bytes) noexcept
{
    LC_ASSERT(bytes >= 0, "memcpy: byte count must be non-negative");
    if (bytes > 0)
        std::memcpy(dst, src, size_t(bytes));
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

namespace impl
{
// only defined for function signatures
template <class T>
struct function_ptr_t;
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   lc::function_ptr<void(lc::byte*, isize, isize, void*)> deallocate_bytes;
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Iterator utilities
// =========================================================================================================

/// A generic end-of-range sentinel type
/// Usage:
///   for (auto const& v : a.difference_view(b)) ...  // iterator != lc::sentinel
struct sentinel
{
};

} // namespace lc

// =========================================================================================================
// Implementation
// =========================================================================================================

// placement new with the lc tag, must live in the global namespace
LC_FORCE_INLINE void* operator new(std::size_t, lc::impl::placement_new_tag, void* ptr) noexcept
{
    return ptr;
}
// only called if a constructor throws, nothing to release
LC_FORCE_INLINE void operator delete(void*, lc::impl::placement_new_tag, void*) noexcept {}
