#pragma once

#include <linear-core/assert.hh>
#include <linear-core/fwd.hh>
#include <linear-core/optional.hh>
#include <linear-core/pair.hh>
#include <linear-core/span.hh>
#include <linear-core/utility.hh>
#include <linear-core/vector.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

// lc::map<K, V> is an associative container over a flat, contiguous run of (key, value) pairs.
//
// There is no hashing and no ordering: keys only need operator==, and every lookup is a linear scan.
// For small maps this beats hash maps on constant factors, iterates in a deterministic order,
// and needs nothing but one growable buffer from a memory resource.
//
// Order:
//   - new keys are appended, so iteration order is insertion order ...
//   - ... until remove() swaps the last pair into the hole (O(1), reorders the tail)
//   - retain() and occupied_entry::remove() compact in place and keep the relative order
//   - insert() on an existing key replaces the value in place and keeps its position
//
// Lookup is heterogeneous: any Q with `K == Q` works, e.g. map<std::string, int>::get("literal").
//
// Entry cursors (map_entry, occupied_entry, vacant_entry) borrow the map exclusively.
// While one is alive the map must not be used directly; debug builds assert this.
//
// Usage:
//   lc::map<std::string, int> counts;
//   for (auto const& word : words)
//       ++counts.entry(word).or_insert(0);
//
//   if (auto v = counts.get("the"); v.has_value())
//       use(v.value());
//
//   for (auto&& [word, count] : counts)
//       print(word, count);

namespace lc::impl
{
/// Number of live entry cursors of a map, tracked in assertion-enabled builds only.
/// A copy starts without cursors: cursors borrow one specific map object.
struct cursor_count
{
#if LC_ASSERT_ENABLED
    cursor_count() = default;
    cursor_count(cursor_count const&) {}
    cursor_count& operator=(cursor_count const&) { return *this; }

    void acquire() { ++_count; }
    void release() { --_count; }
    [[nodiscard]] bool is_free() const { return _count == 0; }

private:
    isize _count = 0;
#else
    void acquire() {}
    void release() {}
    [[nodiscard]] bool is_free() const { return true; }
#endif
};

/// RAII borrow of a map by one entry cursor; moves with the cursor.
template <class MapT>
struct map_borrow
{
    explicit map_borrow(MapT& m) : _map(&m) { m._cursors.acquire(); }
    map_borrow(map_borrow&& rhs) noexcept : _map(lc::exchange(rhs._map, nullptr)) {}
    map_borrow(map_borrow const&) = delete;
    map_borrow& operator=(map_borrow const&) = delete;
    map_borrow& operator=(map_borrow&&) = delete;
    ~map_borrow()
    {
        if (_map)
            _map->_cursors.release();
    }

    [[nodiscard]] MapT& get() const
    {
        LC_ASSERT(_map != nullptr, "entry cursor was already consumed");
        return *_map;
    }

private:
    MapT* _map = nullptr;
};

// projections from a stored pair to what iteration yields

struct project_key
{
    template <class EntryT>
    [[nodiscard]] constexpr auto const& operator()(EntryT& e) const
    {
        return e.first;
    }
};

struct project_value
{
    template <class EntryT>
    [[nodiscard]] constexpr auto& operator()(EntryT& e) const
    {
        return e.second;
    }
};

/// pair<K, V>& -> pair<K const&, V&> and pair<K, V> const& -> pair<K const&, V const&>
struct project_key_value
{
    template <class K, class V>
    [[nodiscard]] constexpr lc::pair<K const&, V&> operator()(lc::pair<K, V>& e) const
    {
        return {e.first, e.second};
    }
    template <class K, class V>
    [[nodiscard]] constexpr lc::pair<K const&, V const&> operator()(lc::pair<K, V> const& e) const
    {
        return {e.first, e.second};
    }
};

/// Forward iterator over contiguous stored pairs, yielding a projection of each pair.
template <class EntryT, class ProjectionT>
struct entry_iterator
{
    using difference_type = isize;
    using reference = decltype(ProjectionT{}(std::declval<EntryT&>()));
    using value_type = std::remove_cvref_t<reference>;

    constexpr entry_iterator() = default;
    constexpr explicit entry_iterator(EntryT* p) : _p(p) {}

    [[nodiscard]] constexpr reference operator*() const { return ProjectionT{}(*_p); }

    constexpr entry_iterator& operator++()
    {
        ++_p;
        return *this;
    }
    constexpr entry_iterator operator++(int)
    {
        auto r = *this;
        ++_p;
        return r;
    }

    [[nodiscard]] constexpr bool operator==(entry_iterator const& rhs) const = default;

    [[nodiscard]] constexpr isize operator-(entry_iterator const& rhs) const { return _p - rhs._p; }

private:
    EntryT* _p = nullptr;
};

/// Restartable [begin, end) view returned by map::keys() and map::values().
template <class EntryT, class ProjectionT>
struct entry_range
{
    using iterator = entry_iterator<EntryT, ProjectionT>;

    constexpr entry_range(EntryT* begin, EntryT* end) : _begin(begin), _end(end) {}

    [[nodiscard]] constexpr iterator begin() const { return iterator(_begin); }
    [[nodiscard]] constexpr iterator end() const { return iterator(_end); }

    [[nodiscard]] constexpr isize size() const { return _end - _begin; }
    [[nodiscard]] constexpr bool empty() const { return _begin == _end; }

private:
    EntryT* _begin;
    EntryT* _end;
};

template <class K, class Q>
concept key_comparable_with = requires(K const& k, Q const& q) {
    { k == q } -> std::convertible_to<bool>;
};
} // namespace lc::impl

/// Associative container with linear-scan lookup over contiguous (key, value) storage.
/// K needs operator==, nothing else (no hash, no ordering).
/// Deep-copyable value type; a moved-from map is empty.
template <class K, class V>
struct lc::map
{
    static_assert(impl::key_comparable_with<K, K>, "map keys must be equality comparable");

    using key_t = K;
    using mapped_t = V;
    using entry_t = lc::pair<K, V>;

    using iterator = impl::entry_iterator<entry_t, impl::project_key_value>;
    using const_iterator = impl::entry_iterator<entry_t const, impl::project_key_value>;

    // construction
public:
    map() = default;

    /// Builds the map by inserting the pairs in order; a repeated key keeps the last value.
    map(std::initializer_list<entry_t> init)
    {
        _entries.reserve(isize(init.size()));
        for (auto const& e : init)
            insert_unchecked(e.first, e.second);
    }

    /// Empty map that can take `capacity` pairs without reallocation.
    /// All later growth uses `resource` (nullptr selects lc::default_memory_resource).
    [[nodiscard]] static map create_with_capacity(isize capacity, lc::memory_resource const* resource = nullptr)
    {
        map m;
        m._entries = lc::vector<entry_t>::create_with_capacity(capacity, resource);
        return m;
    }

    /// Builds a map from any range of pair-likes (lc::pair, std::pair, std::tuple, another map, ...).
    /// Pairs are inserted in range order, so a repeated key ends up with its last value at the position
    /// of its first occurrence. Elements are moved out of rvalue ranges.
    template <class Range>
    [[nodiscard]] static map create_from(Range&& range, lc::memory_resource const* resource = nullptr)
    {
        map m;
        if constexpr (requires { isize(range.size()); })
            m._entries = lc::vector<entry_t>::create_with_capacity(isize(range.size()), resource);
        else
            m._entries = lc::vector<entry_t>::create_with_capacity(0, resource);

        m.insert_range(lc::forward<Range>(range));

        // duplicates may leave unused room
        m._entries.shrink_to_fit();
        return m;
    }

    map(map const&) = default;
    map(map&&) = default;
    map& operator=(map const& rhs)
    {
        LC_ASSERT(_cursors.is_free(), "map assigned while an entry cursor is alive");
        _entries = rhs._entries;
        return *this;
    }
    map& operator=(map&& rhs) noexcept
    {
        LC_ASSERT(_cursors.is_free(), "map assigned while an entry cursor is alive");
        _entries = lc::move(rhs._entries);
        return *this;
    }
    ~map() { LC_ASSERT(_cursors.is_free(), "map destroyed while an entry cursor is alive"); }

    // queries
public:
    [[nodiscard]] isize size() const { return _entries.size(); }
    [[nodiscard]] bool empty() const { return _entries.empty(); }

    /// Number of pairs the map can hold without reallocating.
    [[nodiscard]] isize capacity() const { return _entries.capacity(); }

    /// The memory resource used for allocations, nullptr for the default.
    [[nodiscard]] lc::memory_resource const* resource() const { return _entries.resource(); }

    // lookup
public:
    /// True iff a pair with a key equal to `key` exists.
    /// O(size())
    template <class Q>
        requires impl::key_comparable_with<K, Q>
    [[nodiscard]] bool contains_key(Q const& key) const
    {
        check_no_cursor();
        return find_index(key) >= 0;
    }

    /// Reference to the value stored under `key`, or empty if there is none.
    /// O(size())
    template <class Q>
        requires impl::key_comparable_with<K, Q>
    [[nodiscard]] lc::optional<V const&> get(Q const& key) const
    {
        check_no_cursor();
        auto const idx = find_index(key);
        if (idx < 0)
            return {};
        return _entries[idx].second;
    }
    template <class Q>
        requires impl::key_comparable_with<K, Q>
    [[nodiscard]] lc::optional<V&> get(Q const& key)
    {
        check_no_cursor();
        auto const idx = find_index(key);
        if (idx < 0)
            return {};
        return _entries[idx].second;
    }

    /// The stored (key, value) pair for `key`, or empty if there is none.
    /// Useful when the stored key carries more than the equality-relevant part.
    template <class Q>
        requires impl::key_comparable_with<K, Q>
    [[nodiscard]] lc::optional<entry_t const&> get_key_value(Q const& key) const
    {
        check_no_cursor();
        auto const idx = find_index(key);
        if (idx < 0)
            return {};
        return _entries[idx];
    }

    /// Value stored under `key`.
    /// Precondition: contains_key(key). Use get() when absence is expected.
    template <class Q>
        requires impl::key_comparable_with<K, Q>
    [[nodiscard]] V const& operator[](Q const& key) const
    {
        check_no_cursor();
        auto const idx = find_index(key);
        LC_ASSERT(idx >= 0, "no entry found for key");
        return _entries[idx].second;
    }

    // modifiers
public:
    /// Inserts `value` under `key`.
    /// If the key is already present, its value is replaced in place (the pair keeps its position
    /// and its original key object) and the previous value is returned.
    /// Otherwise the pair is appended and the result is empty.
    /// O(size()), plus amortized O(1) growth.
    lc::optional<V> insert(K key, V value)
    {
        check_no_cursor();
        return insert_unchecked(lc::move(key), lc::move(value));
    }

    /// Removes the pair stored under `key` and returns its value, or empty if there is none.
    /// The last pair is moved into the freed slot: iteration order is NOT preserved.
    /// O(size()) to find, O(1) to remove.
    template <class Q>
        requires impl::key_comparable_with<K, Q>
    lc::optional<V> remove(Q const& key)
    {
        check_no_cursor();
        auto const idx = find_index(key);
        if (idx < 0)
            return {};
        return _entries.pop_at_unordered(idx).second;
    }

    /// Like remove(), but also hands back the stored key.
    template <class Q>
        requires impl::key_comparable_with<K, Q>
    lc::optional<entry_t> remove_entry(Q const& key)
    {
        check_no_cursor();
        auto const idx = find_index(key);
        if (idx < 0)
            return {};
        return _entries.pop_at_unordered(idx);
    }

    /// Keeps only the pairs for which pred(key, value) returns true.
    /// pred sees every pair exactly once, in storage order, and may modify the value.
    /// Single pass; the relative order of the kept pairs is preserved.
    template <class Pred>
    void retain(Pred&& pred)
    {
        static_assert(std::is_invocable_r_v<bool, Pred&, K const&, V&>, "retain predicate must be callable as "
                                                                        "bool(K const&, V&)");
        check_no_cursor();
        _entries.retain([&](entry_t& e) -> bool { return pred(static_cast<K const&>(e.first), e.second); });
    }

    /// Inserts all pairs of a range in order (last write wins).
    template <class Range>
    void extend(Range&& range)
    {
        check_no_cursor();
        insert_range(lc::forward<Range>(range));
    }

    /// Destroys all pairs; keeps the capacity.
    void clear()
    {
        check_no_cursor();
        _entries.clear();
    }

    /// Ensures that `additional` more pairs fit without reallocation.
    void reserve(isize additional)
    {
        check_no_cursor();
        _entries.reserve(additional);
    }

    /// Drops unused capacity.
    void shrink_to_fit()
    {
        check_no_cursor();
        _entries.shrink_to_fit();
    }

    /// Cursor for conditional insert-or-modify at `key`.
    /// Occupied if the key is present (the passed key is dropped), vacant otherwise (the key is kept
    /// for a later insertion). The cursor borrows the map exclusively until it is destroyed.
    /// Usage:
    ///   m.entry("hello").and_modify([](auto& v) { v += "!"; }).or_insert("new");
    [[nodiscard]] lc::map_entry<K, V> entry(K key)
    {
        check_no_cursor();
        auto const idx = find_index(key);
        if (idx >= 0)
            return lc::map_entry<K, V>(*this, idx);
        return lc::map_entry<K, V>(*this, lc::move(key));
    }

    // iteration
public:
    /// Iteration yields lc::pair<K const&, V&> in storage order:
    ///   for (auto&& [k, v] : m) ...
    [[nodiscard]] iterator begin()
    {
        check_no_cursor();
        return iterator(_entries.begin());
    }
    [[nodiscard]] iterator end() { return iterator(_entries.end()); }
    [[nodiscard]] const_iterator begin() const
    {
        check_no_cursor();
        return const_iterator(_entries.begin());
    }
    [[nodiscard]] const_iterator end() const { return const_iterator(_entries.end()); }

    [[nodiscard]] impl::entry_range<entry_t const, impl::project_key> keys() const
    {
        check_no_cursor();
        return {_entries.begin(), _entries.end()};
    }
    [[nodiscard]] impl::entry_range<entry_t, impl::project_value> values()
    {
        check_no_cursor();
        return {_entries.begin(), _entries.end()};
    }
    [[nodiscard]] impl::entry_range<entry_t const, impl::project_value> values() const
    {
        check_no_cursor();
        return {_entries.begin(), _entries.end()};
    }

    /// Read-only view of the stored pairs in storage order.
    [[nodiscard]] lc::span<entry_t const> entries() const
    {
        check_no_cursor();
        return lc::span<entry_t const>(_entries.begin(), _entries.end());
    }

    /// Moves all pairs out in storage order; the map is left empty.
    /// Usage:
    ///   auto pairs = lc::move(m).extract_entries();
    [[nodiscard]] lc::vector<entry_t> extract_entries() &&
    {
        check_no_cursor();
        return lc::move(_entries);
    }

    // comparison
public:
    /// Two maps are equal iff they hold the same (key, value) pairs, in any order.
    /// O(size()^2)
    [[nodiscard]] friend bool operator==(map const& lhs, map const& rhs)
        requires requires(V const& v) { bool(v == v); }
    {
        if (lhs.size() != rhs.size())
            return false;

        // keys are unique on both sides, so "every lhs pair is in rhs" plus equal sizes is a bijection
        for (auto const& e : lhs._entries)
        {
            auto const idx = rhs.find_index(e.first);
            if (idx < 0 || !(rhs._entries[idx].second == e.second))
                return false;
        }
        return true;
    }

    // helper
private:
    template <class Q>
    [[nodiscard]] isize find_index(Q const& key) const
    {
        auto const n = _entries.size();
        auto const p = _entries.data();
        for (isize i = 0; i < n; ++i)
            if (p[i].first == key)
                return i;
        return -1;
    }

    lc::optional<V> insert_unchecked(K key, V value)
    {
        auto const idx = find_index(key);
        if (idx >= 0)
            return lc::exchange(_entries[idx].second, lc::move(value));

        _entries.emplace_back(lc::move(key), lc::move(value));
        return {};
    }

    template <class Range>
    void insert_range(Range&& range)
    {
        for (auto&& [key, value] : range)
        {
            if constexpr (std::is_lvalue_reference_v<Range>)
                insert_unchecked(key, value);
            else
                insert_unchecked(lc::move(key), lc::move(value));
        }
    }

    void check_no_cursor() const { LC_ASSERT(_cursors.is_free(), "map accessed while an entry cursor is alive"); }

    // members
private:
    lc::vector<entry_t> _entries;
    [[no_unique_address]] impl::cursor_count _cursors;

    friend lc::map_entry<K, V>;
    friend lc::occupied_entry<K, V>;
    friend lc::vacant_entry<K, V>;
    friend impl::map_borrow<map>;
    friend lc::set<K>;
};

/// Cursor into a map at one key, either occupied (key present) or vacant (key absent).
///
/// Produced by map::entry(key). Chain with and_modify(), then resolve with one terminal action:
/// or_insert / or_insert_with / or_insert_with_key / or_default, or split into the variant
/// types via occupied() / vacant(). Terminal actions are rvalue-qualified: a cursor is used once.
///
/// The map is borrowed exclusively until the cursor is destroyed.
/// References returned by terminal actions stay valid after that, until the map is modified.
template <class K, class V>
struct lc::map_entry
{
    // queries
public:
    [[nodiscard]] bool is_occupied() const { return _pos >= 0; }
    [[nodiscard]] bool is_vacant() const { return _pos < 0; }

    /// The key of the pair (occupied) or the key that would be inserted (vacant).
    [[nodiscard]] K const& key() const
    {
        if (is_occupied())
            return _borrow.get()._entries[_pos].first;
        return _key.value();
    }

    // chaining
public:
    /// Calls f(value) on the existing value if occupied; does nothing if vacant.
    /// Returns the cursor (moved, together with its borrow) for a following terminal action.
    template <class F>
    map_entry and_modify(F&& f) &&
    {
        static_assert(std::is_invocable_v<F&, V&>, "and_modify callback must be callable with V&");
        if (is_occupied())
            f(_borrow.get()._entries[_pos].second);
        return lc::move(*this);
    }

    // terminal actions
public:
    /// Existing value if occupied; otherwise appends (key, value) and returns the new value.
    V& or_insert(V value) &&
    {
        if (is_occupied())
            return _borrow.get()._entries[_pos].second;
        return append(lc::move(value));
    }

    /// Like or_insert, but the value is only computed (by f()) if the key is vacant.
    template <class F>
    V& or_insert_with(F&& f) &&
    {
        static_assert(std::is_invocable_r_v<V, F&>, "or_insert_with callback must return a V");
        if (is_occupied())
            return _borrow.get()._entries[_pos].second;
        return append(V(f()));
    }

    /// Like or_insert_with, but f receives the key: f(key) -> V.
    template <class F>
    V& or_insert_with_key(F&& f) &&
    {
        static_assert(std::is_invocable_r_v<V, F&, K const&>, "or_insert_with_key callback must be callable as "
                                                              "V(K const&)");
        if (is_occupied())
            return _borrow.get()._entries[_pos].second;
        return append(V(f(static_cast<K const&>(_key.value()))));
    }

    /// Like or_insert with a value-initialized V.
    V& or_default() &&
        requires std::is_default_constructible_v<V>
    {
        if (is_occupied())
            return _borrow.get()._entries[_pos].second;
        return append(V());
    }

    /// Converts to the occupied variant (moving the borrow).
    /// Precondition: is_occupied().
    [[nodiscard]] lc::occupied_entry<K, V> occupied() &&
    {
        LC_ASSERT(is_occupied(), "occupied() called on a vacant entry");
        return lc::occupied_entry<K, V>(lc::move(_borrow), _pos);
    }

    /// Converts to the vacant variant (moving the borrow and the key).
    /// Precondition: is_vacant().
    [[nodiscard]] lc::vacant_entry<K, V> vacant() &&
    {
        LC_ASSERT(is_vacant(), "vacant() called on an occupied entry");
        return lc::vacant_entry<K, V>(lc::move(_borrow), lc::move(_key).value());
    }

    // lifecycle
public:
    map_entry(map_entry&&) = default;
    map_entry(map_entry const&) = delete;
    map_entry& operator=(map_entry const&) = delete;
    map_entry& operator=(map_entry&&) = delete;

private:
    map_entry(lc::map<K, V>& m, isize pos) : _borrow(m), _pos(pos) {}
    map_entry(lc::map<K, V>& m, K&& key) : _borrow(m), _key(lc::move(key)) {}

    V& append(V&& value)
    {
        LC_ASSERT(_key.has_value(), "vacant entry was already consumed");
        auto& m = _borrow.get();
        _pos = m._entries.size();
        return m._entries.emplace_back(lc::move(_key).value(), lc::move(value)).second;
    }

    impl::map_borrow<lc::map<K, V>> _borrow;
    isize _pos = -1;
    lc::optional<K> _key; // only engaged while vacant

    friend lc::map<K, V>;
};

/// Cursor at a key that is present in the map.
template <class K, class V>
struct lc::occupied_entry
{
public:
    [[nodiscard]] K const& key() const { return slot().first; }

    [[nodiscard]] V const& get() const { return slot().second; }
    [[nodiscard]] V& get_mut() { return slot().second; }

    /// The value reference, valid beyond the cursor's lifetime (until the map is modified).
    [[nodiscard]] V& into_mut() && { return slot().second; }

    /// Replaces the value and returns the old one. The key and position are unchanged.
    V insert(V value) { return lc::exchange(slot().second, lc::move(value)); }

    /// Removes the pair and returns its value.
    /// Unlike map::remove, later pairs shift down by one: the order of the rest is preserved.
    V remove() && { return _borrow.get()._entries.pop_at(_pos).second; }

    /// Like remove(), but also hands back the stored key.
    lc::pair<K, V> remove_entry() && { return _borrow.get()._entries.pop_at(_pos); }

    occupied_entry(occupied_entry&&) = default;
    occupied_entry(occupied_entry const&) = delete;
    occupied_entry& operator=(occupied_entry const&) = delete;
    occupied_entry& operator=(occupied_entry&&) = delete;

private:
    occupied_entry(impl::map_borrow<lc::map<K, V>>&& borrow, isize pos) : _borrow(lc::move(borrow)), _pos(pos) {}

    [[nodiscard]] lc::pair<K, V>& slot() const { return _borrow.get()._entries[_pos]; }

    impl::map_borrow<lc::map<K, V>> _borrow;
    isize _pos;

    friend lc::map_entry<K, V>;
};

/// Cursor at a key that is absent from the map; owns that key until insert().
template <class K, class V>
struct lc::vacant_entry
{
public:
    [[nodiscard]] K const& key() const { return _key; }

    /// Takes the key back out without inserting anything.
    [[nodiscard]] K into_key() && { return lc::move(_key); }

    /// Appends (key, value) and returns the new value.
    V& insert(V value) && { return _borrow.get()._entries.emplace_back(lc::move(_key), lc::move(value)).second; }

    vacant_entry(vacant_entry&&) = default;
    vacant_entry(vacant_entry const&) = delete;
    vacant_entry& operator=(vacant_entry const&) = delete;
    vacant_entry& operator=(vacant_entry&&) = delete;

private:
    vacant_entry(impl::map_borrow<lc::map<K, V>>&& borrow, K&& key) : _borrow(lc::move(borrow)), _key(lc::move(key))
    {
    }

    impl::map_borrow<lc::map<K, V>> _borrow;
    K _key;

    friend lc::map_entry<K, V>;
};
