#pragma once

#include <linear-core/assert.hh>
#include <linear-core/fwd.hh>
#include <linear-core/map.hh>
#include <linear-core/optional.hh>
#include <linear-core/pair.hh>
#include <linear-core/utility.hh>
#include <linear-core/vector.hh>

#include <initializer_list>
#include <type_traits>

// lc::set<T> is a collection of unique values with linear-scan membership tests.
//
// It is a thin layer over lc::map<T, lc::unit>: same storage, same order rules
// (insertion order, perturbed by swap-removal in remove() / take()), same cost model.
//
// Set algebra comes in three forms:
//   - lazy views that borrow both operands and allocate nothing:
//       for (auto const& v : a.difference_view(b)) ...
//   - free functions and operators that build a new set:
//       auto u = lc::set_union(a, b);   auto d = a - b;
//   - compound assignment that updates the left operand:
//       a |= b;  a &= b;  a -= b;  a ^= b;
// All of them test membership by scanning, i.e. O(size(a) * size(b)).
//
// Result order:
//   union:                all of a (in a's order), then the elements of b missing from a
//   intersection:         elements of a that are in b, in a's order
//   difference:           elements of a missing from b, in a's order
//   symmetric difference: a - b, then b - a

namespace lc
{
template <class T>
[[nodiscard]] set<T> set_union(set<T> const& a, set<T> const& b);
template <class T>
[[nodiscard]] set<T> set_intersection(set<T> const& a, set<T> const& b);
template <class T>
[[nodiscard]] set<T> set_difference(set<T> const& a, set<T> const& b);
template <class T>
[[nodiscard]] set<T> set_symmetric_difference(set<T> const& a, set<T> const& b);
} // namespace lc

namespace lc::impl
{
enum class set_op
{
    difference,
    intersection,
    symmetric_difference,
    union_
};

/// Lazy, restartable view over the result of a set operation.
/// Holds pointers to both operands, which must outlive the view and stay unmodified while it is iterated.
/// Iteration ends at lc::sentinel.
template <class T, set_op Op>
struct set_algebra_view
{
    struct iterator
    {
        using difference_type = isize;
        using value_type = T;

        [[nodiscard]] T const& operator*() const
        {
            LC_ASSERT(_phase < 2, "dereferencing an exhausted set view iterator");
            return _phase == 0 ? at(*_a, _idx) : at(*_b, _idx);
        }

        iterator& operator++()
        {
            ++_idx;
            settle();
            return *this;
        }
        void operator++(int) { ++*this; }

        [[nodiscard]] bool operator==(lc::sentinel) const { return _phase == 2; }

    private:
        iterator(lc::set<T> const* a, lc::set<T> const* b) : _a(a), _b(b) { settle(); }

        // phase 0 walks a, phase 1 walks b, phase 2 is the end
        void settle()
        {
            if (_phase == 0)
            {
                for (; _idx < _a->size(); ++_idx)
                    if (keep_from_a(at(*_a, _idx)))
                        return;

                _idx = 0;
                _phase = walks_b ? 1 : 2;
            }

            if (_phase == 1)
            {
                for (; _idx < _b->size(); ++_idx)
                    if (!_a->contains(at(*_b, _idx)))
                        return;

                _phase = 2;
            }
        }

        [[nodiscard]] bool keep_from_a(T const& v) const
        {
            if constexpr (Op == set_op::intersection)
                return _b->contains(v);
            else if constexpr (Op == set_op::union_)
                return true;
            else // difference, symmetric_difference
                return !_b->contains(v);
        }

        static constexpr bool walks_b = Op == set_op::symmetric_difference || Op == set_op::union_;

        lc::set<T> const* _a;
        lc::set<T> const* _b;
        isize _idx = 0;
        int _phase = 0;

        friend set_algebra_view;
    };

    [[nodiscard]] iterator begin() const { return iterator(_a, _b); }
    [[nodiscard]] lc::sentinel end() const { return {}; }

    /// Number of elements the view yields. O(size(a) * size(b))
    [[nodiscard]] isize count() const
    {
        isize n = 0;
        for (auto it = begin(); it != end(); ++it)
            ++n;
        return n;
    }

    set_algebra_view(lc::set<T> const& a, lc::set<T> const& b) : _a(&a), _b(&b) {}

private:
    [[nodiscard]] static T const& at(lc::set<T> const& s, isize i) { return s.element_at(i); }

    lc::set<T> const* _a;
    lc::set<T> const* _b;
};
} // namespace lc::impl

/// Collection of unique values with linear-scan membership.
/// T needs operator==, nothing else.
/// Deep-copyable value type; a moved-from set is empty.
template <class T>
struct lc::set
{
    using value_t = T;
    using const_iterator = impl::entry_iterator<lc::pair<T, lc::unit> const, impl::project_key>;

    // construction
public:
    set() = default;

    /// Builds the set by inserting the values in order; repeated values keep their first occurrence.
    set(std::initializer_list<T> init)
    {
        _map.reserve(isize(init.size()));
        for (auto const& v : init)
            insert(v);
    }

    /// Empty set that can take `capacity` values without reallocation.
    [[nodiscard]] static set create_with_capacity(isize capacity, lc::memory_resource const* resource = nullptr)
    {
        set s;
        s._map = lc::map<T, lc::unit>::create_with_capacity(capacity, resource);
        return s;
    }

    /// Builds a set from any range of values (including the lazy algebra views).
    /// Values are moved out of rvalue ranges.
    template <class Range>
    [[nodiscard]] static set create_from(Range&& range, lc::memory_resource const* resource = nullptr)
    {
        isize capacity = 0;
        if constexpr (requires { isize(range.size()); })
            capacity = isize(range.size());

        auto s = create_with_capacity(capacity, resource);
        s.insert_range(lc::forward<Range>(range));
        s._map.shrink_to_fit();
        return s;
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _map.size(); }
    [[nodiscard]] bool empty() const { return _map.empty(); }
    [[nodiscard]] isize capacity() const { return _map.capacity(); }
    [[nodiscard]] lc::memory_resource const* resource() const { return _map.resource(); }

    template <class Q>
        requires impl::key_comparable_with<T, Q>
    [[nodiscard]] bool contains(Q const& value) const
    {
        return _map.contains_key(value);
    }

    /// The stored value equal to `value`, or empty.
    template <class Q>
        requires impl::key_comparable_with<T, Q>
    [[nodiscard]] lc::optional<T const&> get(Q const& value) const
    {
        auto const idx = _map.find_index(value);
        if (idx < 0)
            return {};
        return element_at(idx);
    }

    // modifiers
public:
    /// Adds `value` if no equal value is present.
    /// Returns true iff the set did not contain it before (the stored value is then left untouched).
    bool insert(T value) { return !_map.insert(lc::move(value), lc::unit{}).has_value(); }

    /// Removes the value equal to `value`; true iff one was present.
    /// Swap-removal: the last value takes the freed slot.
    template <class Q>
        requires impl::key_comparable_with<T, Q>
    bool remove(Q const& value)
    {
        return _map.remove(value).has_value();
    }

    /// Removes and returns the stored value equal to `value`, or empty.
    /// Swap-removal like remove().
    template <class Q>
        requires impl::key_comparable_with<T, Q>
    lc::optional<T> take(Q const& value)
    {
        auto const idx = _map.find_index(value);
        if (idx < 0)
            return {};
        return _map._entries.pop_at_unordered(idx).first;
    }

    /// Adds `value`, replacing an equal stored value in place (same position).
    /// Returns the replaced value, or empty if `value` was new.
    lc::optional<T> replace(T value)
    {
        auto const idx = _map.find_index(value);
        if (idx >= 0)
            return lc::exchange(_map._entries[idx].first, lc::move(value));

        _map._entries.emplace_back(lc::move(value), lc::unit{});
        return {};
    }

    /// The stored value equal to `value`; inserts `value` first if there is none.
    T const& get_or_insert(T value)
    {
        auto const idx = _map.find_index(value);
        if (idx >= 0)
            return element_at(idx);
        return _map._entries.emplace_back(lc::move(value), lc::unit{}).first;
    }

    /// The stored value equal to `value`; if there is none, inserts f(value).
    /// f must build a T that compares equal to `value`.
    template <class Q, class F>
        requires impl::key_comparable_with<T, Q>
    T const& get_or_insert_with(Q const& value, F&& f)
    {
        static_assert(std::is_invocable_r_v<T, F&, Q const&>, "get_or_insert_with callback must be callable as "
                                                              "T(Q const&)");
        auto const idx = _map.find_index(value);
        if (idx >= 0)
            return element_at(idx);

        T new_value = f(value);
        LC_ASSERT(new_value == value, "get_or_insert_with: the built value does not equal the lookup value");
        return _map._entries.emplace_back(lc::move(new_value), lc::unit{}).first;
    }

    /// Keeps only the values for which pred(value) is true; order of the kept values is preserved.
    template <class Pred>
    void retain(Pred&& pred)
    {
        static_assert(std::is_invocable_r_v<bool, Pred&, T const&>, "retain predicate must be callable as "
                                                                    "bool(T const&)");
        _map.retain([&](T const& v, lc::unit&) -> bool { return pred(v); });
    }

    /// Inserts all values of a range in order.
    template <class Range>
    void extend(Range&& range)
    {
        insert_range(lc::forward<Range>(range));
    }

    void clear() { _map.clear(); }
    void reserve(isize additional) { _map.reserve(additional); }
    void shrink_to_fit() { _map.shrink_to_fit(); }

    // relations
public:
    /// True iff no value is in both sets.
    [[nodiscard]] bool is_disjoint(set const& other) const
    {
        // scan the smaller side
        auto const& small = size() <= other.size() ? *this : other;
        auto const& large = size() <= other.size() ? other : *this;
        for (auto const& v : small)
            if (large.contains(v))
                return false;
        return true;
    }

    /// True iff every value of this set is in `other`.
    [[nodiscard]] bool is_subset(set const& other) const
    {
        if (size() > other.size())
            return false;
        for (auto const& v : *this)
            if (!other.contains(v))
                return false;
        return true;
    }

    /// True iff every value of `other` is in this set.
    [[nodiscard]] bool is_superset(set const& other) const { return other.is_subset(*this); }

    // lazy algebra views
public:
    [[nodiscard]] impl::set_algebra_view<T, impl::set_op::difference> difference_view(set const& other) const
    {
        return {*this, other};
    }
    [[nodiscard]] impl::set_algebra_view<T, impl::set_op::intersection> intersection_view(set const& other) const
    {
        return {*this, other};
    }
    [[nodiscard]] impl::set_algebra_view<T, impl::set_op::symmetric_difference> symmetric_difference_view(set const& other) const
    {
        return {*this, other};
    }
    [[nodiscard]] impl::set_algebra_view<T, impl::set_op::union_> union_view(set const& other) const
    {
        return {*this, other};
    }

    // iteration
public:
    /// Values in storage order; values are immutable while stored.
    [[nodiscard]] const_iterator begin() const { return const_iterator(_map._entries.begin()); }
    [[nodiscard]] const_iterator end() const { return const_iterator(_map._entries.end()); }

    [[nodiscard]] impl::entry_range<lc::pair<T, lc::unit> const, impl::project_key> elements() const
    {
        return {_map._entries.begin(), _map._entries.end()};
    }

    /// Moves all values out in storage order; the set is left empty.
    [[nodiscard]] lc::vector<T> extract_elements() &&
    {
        auto result = lc::vector<T>::create_with_capacity(size(), resource());
        for (auto& e : _map._entries)
            result.emplace_back_stable(lc::move(e.first));
        _map.clear();
        return result;
    }

    // operators
public:
    /// Equal iff both sets hold the same values, in any order.
    [[nodiscard]] friend bool operator==(set const& lhs, set const& rhs)
    {
        return lhs.size() == rhs.size() && lhs.is_subset(rhs);
    }

    [[nodiscard]] friend set operator|(set const& a, set const& b) { return lc::set_union(a, b); }
    [[nodiscard]] friend set operator&(set const& a, set const& b) { return lc::set_intersection(a, b); }
    [[nodiscard]] friend set operator-(set const& a, set const& b) { return lc::set_difference(a, b); }
    [[nodiscard]] friend set operator^(set const& a, set const& b) { return lc::set_symmetric_difference(a, b); }

    /// Appends the values of b that are missing, in b's order.
    set& operator|=(set const& b)
    {
        if (this == &b)
            return *this;
        for (auto const& v : b)
            if (!contains(v))
                push_unique(v);
        return *this;
    }

    set& operator&=(set const& b)
    {
        if (this != &b)
            retain([&](T const& v) { return b.contains(v); });
        return *this;
    }

    set& operator-=(set const& b)
    {
        if (this == &b)
            clear();
        else
            retain([&](T const& v) { return !b.contains(v); });
        return *this;
    }

    /// Same order as set_symmetric_difference: the kept values of a, then the new values of b.
    set& operator^=(set const& b)
    {
        if (this == &b)
        {
            clear();
            return *this;
        }

        // collect before retain() changes what "in a" means
        auto added = lc::vector<T>::create_with_capacity(0, resource());
        for (auto const& v : b)
            if (!contains(v))
                added.push_back(v);

        retain([&](T const& v) { return !b.contains(v); });

        for (auto& v : added)
            push_unique(lc::move(v));
        return *this;
    }

    // helper
private:
    [[nodiscard]] T const& element_at(isize i) const { return _map._entries[i].first; }

    /// Precondition: !contains(value)
    void push_unique(T value) { _map._entries.emplace_back(lc::move(value), lc::unit{}); }

    template <class Range>
    void insert_range(Range&& range)
    {
        for (auto&& v : range)
        {
            if constexpr (std::is_lvalue_reference_v<Range>)
                insert(v);
            else
                insert(lc::move(v));
        }
    }

    template <class U>
    static set collect_unique(U const& view, isize capacity, lc::memory_resource const* resource)
    {
        auto result = create_with_capacity(capacity, resource);
        for (auto const& v : view)
            result.push_unique(v);
        return result;
    }

    // members
private:
    lc::map<T, lc::unit> _map;

    template <class U, impl::set_op Op>
    friend struct impl::set_algebra_view;

    friend set lc::set_union<T>(set const&, set const&);
    friend set lc::set_intersection<T>(set const&, set const&);
    friend set lc::set_difference<T>(set const&, set const&);
    friend set lc::set_symmetric_difference<T>(set const&, set const&);
};

/// New set with the values in a or b: all of a, then b - a.
/// The result uses a's memory resource.
template <class T>
lc::set<T> lc::set_union(set<T> const& a, set<T> const& b)
{
    return set<T>::collect_unique(a.union_view(b), a.size() + b.size(), a.resource());
}

/// New set with the values in both a and b, in a's order.
template <class T>
lc::set<T> lc::set_intersection(set<T> const& a, set<T> const& b)
{
    return set<T>::collect_unique(a.intersection_view(b), lc::min(a.size(), b.size()), a.resource());
}

/// New set with the values of a that are not in b, in a's order.
template <class T>
lc::set<T> lc::set_difference(set<T> const& a, set<T> const& b)
{
    return set<T>::collect_unique(a.difference_view(b), a.size(), a.resource());
}

/// New set with the values in exactly one of a and b: a - b, then b - a.
template <class T>
lc::set<T> lc::set_symmetric_difference(set<T> const& a, set<T> const& b)
{
    return set<T>::collect_unique(a.symmetric_difference_view(b), a.size() + b.size(), a.resource());
}
