#pragma once

#include <linear-core/impl/allocating_container.hh>


/// Dynamically allocated vector of T elements with value semantics.
/// Similar to std::vector, reduced to what the maps need: appends, removal by index, retain.
/// Owns the underlying memory through lc::allocation<T>.
/// This is the storage of lc::map and lc::set: one contiguous run of entries, searched linearly.
template <class T>
struct lc::vector : private lc::impl::allocating_container<T, vector<T>>
{
    using base = lc::impl::allocating_container<T, vector<T>>;

    // element access
public:
    using base::operator[]; // access element by index
    using base::data;       // get pointer to underlying storage

    // iterators
public:
    using base::begin; // get pointer to first element
    using base::end;   // get pointer to one past last element

    // queries
public:
    using base::empty;    // check if vector is empty
    using base::resource; // memory resource used for (re)allocations, nullptr for the default
    using base::size;     // get number of elements

    // capacity queries
public:
    using base::capacity_back; // get available capacity at back

    /// Returns the total capacity (elements that can be stored without reallocation).
    [[nodiscard]] constexpr isize capacity() const { return size() + capacity_back(); }

    /// Ensures that at least `additional` more elements fit without reallocation.
    void reserve(isize additional) { base::reserve_back(additional); }

    using base::shrink_to_fit; // drop unused capacity

    // factories
public:
    using base::create_with_capacity; // create with reserved capacity

    // modifiers
public:
    using base::clear; // destroy all elements, size becomes 0

    using base::emplace_back;        // construct element at back (with allocation if needed)
    using base::emplace_back_stable; // construct element at back (requires capacity)
    using base::push_back;           // add element at back (with allocation if needed)

    using base::pop_at;           // remove and return element at index (preserves order)
    using base::pop_at_unordered; // remove and return element at index (O(1), does not preserve order)

    using base::retain; // keep elements matching a predicate (preserves order)

    // vector has deep-copy value semantics
    vector() = default;
    ~vector() = default;
    vector(vector&&) = default;
    vector& operator=(vector&&) = default;
    vector(vector const&) = default;
    vector& operator=(vector const&) = default;

    /// Element-wise equality, order-sensitive.
    [[nodiscard]] friend bool operator==(vector const& lhs, vector const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs.size() != rhs.size())
            return false;
        for (isize i = 0; i < lhs.size(); ++i)
            if (!(lhs[i] == rhs[i]))
                return false;
        return true;
    }

    friend base;
};
