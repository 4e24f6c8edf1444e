#pragma once

#include <linear-core/fwd.hh>
#include <linear-core/utility.hh>

#include <utility>

/// Empty value type.
/// set<T> stores its elements as map<T, unit>; the unit costs no storage inside a pair.
struct lc::unit
{
    [[nodiscard]] friend constexpr bool operator==(unit, unit) { return true; }
};

/// Simple pair type holding two values of potentially different types
/// Aggregate type with no user-defined constructors
/// Supports structured bindings natively
/// Both members may be references: pair<K const&, V&> is the element type of map iteration.
template <class T, class U>
struct lc::pair
{
    using first_t = T;
    using second_t = U;

    [[nodiscard]] friend constexpr bool operator==(pair const&, pair const&) = default;

    [[no_unique_address]] T first;
    [[no_unique_address]] U second;

    template <std::size_t I, class P>
    [[nodiscard]] friend constexpr decltype(auto) get(P&& p) noexcept
        requires(std::is_same_v<std::remove_cvref_t<P>, pair> && I < 2)
    {
        if constexpr (I == 0)
            return (lc::forward<P>(p).first);
        else
            return (lc::forward<P>(p).second);
    }
};

namespace std
{
template <class T, class U>
struct tuple_size<lc::pair<T, U>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class T, class U>
struct tuple_element<I, lc::pair<T, U>>
{
    static_assert(I < 2);
    using type = std::conditional_t<I == 0, T, U>;
};
} // namespace std
