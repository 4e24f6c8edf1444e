#pragma once

#include <linear-core/allocation.hh>


/// Mixin implementing the "contiguous container over lc::allocation<T>" surface area.
///
/// This is a CRTP-style helper: concrete containers privately inherit it as
/// `lc::impl::allocating_container<T, Derived>`, then selectively re-expose members via `using`.
/// Example (abridged):
///
///     template<class T>
///     struct lc::vector : private lc::impl::allocating_container<T, vector<T>> {
///         using base = lc::impl::allocating_container<T, vector<T>>;
///         using base::operator[];
///         using base::begin; using base::end;
///         using base::size;  using base::empty;
///         // ...
///     };
///
/// Growth only happens at the back. Removal by index comes in two flavors:
/// - ordered (pop_at): O(n), later elements shift down by one, relative order is kept
/// - unordered (pop_at_unordered): O(1), the last element moves into the hole
///
/// Member functions with the `_stable` suffix never reallocate and keep references stable.
///
///
/// === Exception & reference guarantees ===
///
/// Allocation failures are fatal (see allocation.cc), they never leave a half-updated container.
/// Element construction failures leave size and live range unchanged.
/// Reallocation always uses move construction (no copy fallback).
/// The old allocation remains valid until the new element is constructed, so
/// `v.emplace_back(v[i])` is safe during growth.
/// Any reallocation invalidates pointers, references, and iterators.
template <class T, class ContainerT>
struct lc::impl::allocating_container
{
    using container_t = ContainerT;

    /// Alignment used for heap allocations of this container.
    static constexpr isize alloc_alignment = isize(alignof(T));

    /// Maximum extra slack allowed when growing an allocation.
    /// Lets allocators that round to size classes hand out their full class, capped at one page.
    static constexpr isize alloc_max_slack = 4096;

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        auto const p_obj = _data.obj_start + i;
        LC_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");
        return *p_obj;
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        auto const p_obj = _data.obj_start + i;
        LC_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");
        return *p_obj;
    }

    /// May be nullptr if default-constructed or never allocated.
    [[nodiscard]] constexpr T* data() { return _data.obj_start; }
    [[nodiscard]] constexpr T const* data() const { return _data.obj_start; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data.obj_start; }
    [[nodiscard]] constexpr T* end() { return _data.obj_end; }
    [[nodiscard]] constexpr T const* begin() const { return _data.obj_start; }
    [[nodiscard]] constexpr T const* end() const { return _data.obj_end; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] constexpr bool empty() const { return _data.obj_start == _data.obj_end; }

    /// How many elements can be appended without reallocation.
    [[nodiscard]] constexpr isize capacity_back() const
    {
        // nullptr - nullptr == 0 is well-defined, so the empty state needs no special case
        auto const back_bytes = _data.alloc_end - (lc::byte const*)_data.obj_end;
        return back_bytes / isize(sizeof(T));
    }

    /// True iff `count` more elements fit without reallocation.
    [[nodiscard]] constexpr bool has_capacity_back_for(isize count) const
    {
        auto const back_bytes = _data.alloc_end - (lc::byte const*)_data.obj_end;
        return back_bytes >= count * isize(sizeof(T));
    }

    /// The memory resource used for allocations, nullptr for the default.
    [[nodiscard]] constexpr lc::memory_resource const* resource() const { return _data.custom_resource; }

    // resizing
public:
    /// Next allocation size when growing: doubling for amortized O(1) appends.
    [[nodiscard]] static constexpr isize alloc_grow_size_for(isize curr_bytes, isize min_bytes)
    {
        return lc::max(curr_bytes << 1, min_bytes);
    }

    /// Destroys all elements; keeps the allocation and the memory resource.
    constexpr void clear()
    {
        impl::destroy_objects_in_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    /// Ensures that at least `count` more elements can be appended without reallocation.
    /// Exact: does not apply the doubling policy.
    void reserve_back(isize count)
    {
        LC_ASSERT(count >= 0, "reserve count must be non-negative");
        if (has_capacity_back_for(count))
            return;

        auto const min_bytes = (size() + count) * isize(sizeof(T));
        _data.resize_alloc(min_bytes, min_bytes, alloc_alignment);
    }

    /// Drops unused capacity. Reallocates (and thus invalidates references) if the resource cannot
    /// shrink in place. An empty container releases its allocation completely.
    void shrink_to_fit()
    {
        if (!has_capacity_back_for(1))
            return;

        if (empty())
        {
            auto const resource = _data.custom_resource;
            _data = lc::allocation<T>();
            _data.custom_resource = resource;
            return;
        }

        auto const bytes = size() * isize(sizeof(T));
        _data.resize_alloc(bytes, bytes, alloc_alignment);
    }

    // appends
public:
    /// Constructs a new element at the back using existing capacity.
    /// Precondition: has_capacity_back_for(1).
    /// Never reallocates; pointers, references, and iterators remain valid.
    template <class... Args>
    constexpr T& emplace_back_stable(Args&&... args)
    {
        static_assert(
            requires { T(lc::forward<Args>(args)...); }, "emplace_back_stable: T is not constructible from "
                                                         "the provided argument types");
        LC_ASSERT(has_capacity_back_for(1), "not enough capacity for emplace_back_stable");
        auto const p = new (lc::placement_new, _data.obj_end) T(lc::forward<Args>(args)...);
        _data.obj_end++; // _after_ so exceptions in T(...) leave the state valid
        return *p;
    }

    /// Ensures capacity to add count elements at the back, allocating if necessary.
    /// Returns a pointer to the obj_end that construction must write through.
    ///
    /// Cold path: only called from [[unlikely]] branches so the happy path stays inlinable.
    ///
    /// Usage pattern (begin/finalize sandwich):
    ///   allocation<T> new_allocation;
    ///   auto p_obj_end = &_data.obj_end;
    ///
    ///   if (!has_capacity_back_for(1)) [[unlikely]]
    ///       p_obj_end = ensure_capacity_back_begin(new_allocation, 1);
    ///
    ///   // construct BEFORE moving the old objects: arguments may reference them
    ///   auto const p = new (lc::placement_new, *p_obj_end) T(...);
    ///   (*p_obj_end)++;
    ///
    ///   if (new_allocation.is_valid()) [[unlikely]]
    ///       ensure_capacity_back_finalize(new_allocation);
    LC_COLD_FUNC [[nodiscard]] T** ensure_capacity_back_begin(allocation<T>& new_allocation, isize count)
    {
        LC_ASSERT(!has_capacity_back_for(count), "only call this if we don't have enough capacity");

        auto const new_size_request_min = alloc_grow_size_for(_data.alloc_size_bytes(), (size() + count) * isize(sizeof(T)));
        auto const new_size_request_max = new_size_request_min + lc::min(new_size_request_min, alloc_max_slack);

        // growing in place keeps the old objects where they are
        if ((lc::byte*)_data.obj_start == _data.alloc_start
            && _data.try_resize_alloc_inplace(new_size_request_min, new_size_request_max))
            return &_data.obj_end;

        new_allocation = lc::allocation<T>::create_empty_bytes(new_size_request_min, new_size_request_max,
                                                               alloc_alignment, _data.custom_resource);

        // the new allocation's live range starts behind the slots reserved for the old objects,
        // so a throwing constructor only needs to clean up newly built objects
        new_allocation.obj_start = new_allocation.obj_start + size();
        new_allocation.obj_end = new_allocation.obj_start;
        return &new_allocation.obj_end;
    }

    /// Moves the old objects in front of the newly constructed ones and adopts new_allocation.
    /// Precondition: new_allocation.is_valid().
    LC_COLD_FUNC void ensure_capacity_back_finalize(allocation<T>& new_allocation)
    {
        LC_ASSERT(new_allocation.is_valid(), "only call this when we have a temporary alloc");

        impl::move_create_objects_to_reverse(new_allocation.obj_start, _data.obj_start, _data.obj_end);

        // destroys the moved-from old objects and releases the old block
        _data = lc::move(new_allocation);
    }

    /// Appends a new element to the back, allocating if necessary.
    /// Amortized O(1).
    template <class... Args>
    constexpr T& emplace_back(Args&&... args)
    {
        static_assert(
            requires { T(lc::forward<Args>(args)...); }, "emplace_back: T is not constructible from "
                                                         "the provided argument types");

        allocation<T> new_allocation;
        auto p_obj_end = &_data.obj_end;

        if (!has_capacity_back_for(1)) [[unlikely]]
            p_obj_end = ensure_capacity_back_begin(new_allocation, 1);

        auto const p = new (lc::placement_new, *p_obj_end) T(lc::forward<Args>(args)...);
        (*p_obj_end)++; // _after_ so exceptions in T(...) leave state valid

        if (new_allocation.is_valid()) [[unlikely]]
            ensure_capacity_back_finalize(new_allocation);

        return *p;
    }

    constexpr T& push_back(T const& value) { return emplace_back(value); }
    constexpr T& push_back(T&& value) { return emplace_back(lc::move(value)); }

    // removals
public:
    /// Removes and returns the element at idx, shifting all later elements down by one.
    /// Precondition: 0 <= idx < size().
    /// O(n), preserves order.
    [[nodiscard]] constexpr T pop_at(isize idx)
    {
        auto const p_obj = _data.obj_start + idx;
        LC_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");

        auto value = lc::move(*p_obj);
        impl::compact_move_objects_backward(p_obj, p_obj + 1, _data.obj_end);

        _data.obj_end--;
        _data.obj_end->~T();

        return value;
    }

    /// Removes and returns the element at idx; the last element moves into the hole.
    /// Precondition: 0 <= idx < size().
    /// O(1), does not preserve order.
    [[nodiscard]] constexpr T pop_at_unordered(isize idx)
    {
        auto const p_obj = _data.obj_start + idx;
        LC_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");

        auto value = lc::move(*p_obj);

        _data.obj_end--;
        if (p_obj != _data.obj_end)
            *p_obj = lc::move(*_data.obj_end);

        _data.obj_end->~T();

        return value;
    }

    /// Keeps only the elements for which keep(element) returns true.
    /// Visits every element exactly once in order; keep may modify the element.
    /// O(n), preserves the relative order of the kept elements.
    template <class KeepF>
    constexpr void retain(KeepF&& keep)
    {
        auto const new_end = impl::compact_retain_objects(_data.obj_start, _data.obj_end, keep);
        impl::destroy_objects_in_reverse(new_end, _data.obj_end);
        _data.obj_end = new_end;
    }

    // ctors / allocation
public:
    /// Empty container that can take `capacity` elements without reallocation.
    [[nodiscard]] static container_t create_with_capacity(isize capacity, lc::memory_resource const* resource = nullptr)
    {
        LC_ASSERT(capacity >= 0, "capacity must be non-negative");
        auto const byte_size = capacity * isize(sizeof(T));
        container_t c;
        c._data = lc::allocation<T>::create_empty_bytes(byte_size, byte_size, alloc_alignment, resource);
        return c;
    }

    allocating_container() = default;
    ~allocating_container() = default;

    allocating_container(allocating_container&&) = default;
    allocating_container& operator=(allocating_container&&) = default;

    // deep copy semantics, the copy is tight (capacity == size)
    allocating_container(allocating_container const& rhs)
      : _data(lc::allocation<T>::create_copy_of(rhs._data.obj_span(), alloc_alignment, rhs._data.custom_resource))
    {
    }
    allocating_container& operator=(allocating_container const& rhs)
    {
        if (this != &rhs)
            _data = lc::allocation<T>::create_copy_of(rhs._data.obj_span(), alloc_alignment,
                                                      _data.custom_resource); // keep lhs resource
        return *this;
    }

private:
    lc::allocation<T> _data;
};
