#pragma once

#include <linear-core/assert.hh>
#include <linear-core/fwd.hh>
#include <linear-core/utility.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Construct as lc::nullopt to explicitly assign or compare against empty optionals.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct lc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace lc
{
/// The canonical instance of nullopt_t used to construct or assign empty optionals.
/// Usage: optional<int> opt = nullopt; or if (opt == nullopt).
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace lc

/// Sum type representing either a value of type T or no value (T | none), similar to std::optional.
/// Every "maybe" result of the containers is one of these: the value displaced by map::insert,
/// the value taken out by map::remove, the key found by set::get, ...
/// Provides a safer subset of std::optional's API: no operator* or operator-> to avoid misuse.
/// Equality comparison available; other relational operators deliberately omitted.
/// Trivially copyable when T is trivially copyable; otherwise uses T's move/copy semantics.
/// optional<T&> is specialized below as a nullable reference.
template <class T>
struct lc::optional
{
    // construction
public:
    /// Default optional is empty: has_value() == false.
    optional() = default;

    /// Constructs an optional holding the given value; conditionally explicit.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (lc::placement_new, &_storage.value) T(lc::forward<U>(value));
    }

    /// Constructs an empty optional from lc::nullopt.
    optional(nullopt_t) {}

    // trivial copy/move/destroy - defaulted when T allows bitwise operations
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy - custom implementation when T requires special handling
public:
    /// Move constructor for non-trivial T: move-constructs value, then destroys rhs and marks it empty.
    /// After this operation, rhs.has_value() == false; avoids double-destruction.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (lc::placement_new, &_storage.value) T(lc::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (lc::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Move assignment for non-trivial T: moves or constructs from rhs, handling all state combinations.
    /// Leaves rhs engaged with a moved-from value (matches std::optional behavior).
    /// This makes subobject self-move safe: my_opt = lc::move(my_opt.value().sub_opt) works.
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = lc::move(rhs._storage.value);
            else
                new (lc::placement_new, &_storage.value) T(lc::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (lc::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    /// Returns true if this optional holds a value, false if empty.
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Returns a reference to the held value, preserving the value category of the optional itself.
    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() &
    {
        LC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        LC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        LC_ASSERT(_has_value, "attempted to access value of empty optional");
        return lc::move(_storage.value);
    }

    /// Returns the held value or the fallback if empty.
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(lc::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return _has_value ? lc::move(_storage.value) : static_cast<T>(lc::forward<U>(fallback));
    }

    /// Destroys the held value (if any), leaving the optional empty.
    void reset()
    {
        if (_has_value)
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
                _storage.value.~T();
            _has_value = false;
        }
    }

    // comparison
public:
    /// Equality comparison: two optionals are equal if both empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// Equality comparison with a value: false if the optional is empty.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Deleted when T is not bool, so optional<int> never compares against true/false.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    /// Value is constructed in-place when the optional is engaged.
    lc::storage_for<T> _storage;

    /// True when _storage.value holds a live T object.
    bool _has_value = false;
};

/// Nullable reference: either refers to a T or to nothing.
/// This is what lookups return (map::get, map::get_mut, set::get), so a found value can be
/// inspected or modified in place without copying it out.
/// Copying the optional copies the reference, never the referee.
/// Assignment rebinds; it never writes through.
template <class T>
struct lc::optional<T&>
{
    // construction
public:
    constexpr optional() = default;
    constexpr optional(nullopt_t) {}

    /// Binds to the given object.
    template <class U>
        requires std::is_convertible_v<U*, T*>
    constexpr optional(U& value) : _ptr(&value) // NOLINT
    {
    }

    /// optional<T&> -> optional<T const&>
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U*, T*>)
    constexpr optional(optional<U&> rhs) : _ptr(rhs.has_value() ? &rhs.value() : nullptr) // NOLINT
    {
    }

    // binding to a temporary would dangle immediately
    optional(T&&) = delete;

    // queries and access
public:
    [[nodiscard]] constexpr bool has_value() const { return _ptr != nullptr; }

    /// Returns the referee.
    /// Precondition: has_value() == true.
    [[nodiscard]] constexpr T& value() const
    {
        LC_ASSERT(_ptr != nullptr, "attempted to access value of empty optional");
        return *_ptr;
    }

    /// Copies the referee out, or returns the fallback if empty.
    template <class U>
    [[nodiscard]] std::remove_cv_t<T> value_or(U&& fallback) const
    {
        return _ptr ? *_ptr : static_cast<std::remove_cv_t<T>>(lc::forward<U>(fallback));
    }

    constexpr void reset() { _ptr = nullptr; }

    // comparison
public:
    /// Compares the referees, not the addresses.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        if (lhs.has_value() != rhs.has_value())
            return false;
        return !lhs.has_value() || *lhs._ptr == *rhs._ptr;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, std::remove_cv_t<T> const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        return lhs._ptr != nullptr && *lhs._ptr == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return lhs._ptr == nullptr; }

    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<std::remove_cv_t<T>, bool>)
    = delete;

    // members
private:
    T* _ptr = nullptr;
};
