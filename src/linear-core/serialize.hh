#pragma once

#include <linear-core/fwd.hh>
#include <linear-core/map.hh>
#include <linear-core/optional.hh>
#include <linear-core/pair.hh>
#include <linear-core/set.hh>

#include <concepts>

// Bridge between lc::map / lc::set and an external archive.
//
// Both containers travel as a plain sequence in storage order:
// a map as a sequence of lc::pair<K, V>, a set as a sequence of T.
// Reading builds a fresh container by repeated insert(), so a map keeps the last value of a
// duplicated key and a set keeps the first occurrence of a duplicated value.
//
// The archive is duck-typed and never owned:
//
//   writer:
//     w.begin_sequence(isize count);
//     w.write_element(e);               // once per element, e is lc::pair<K, V> const& or T const&
//     w.end_sequence();
//
//   reader:
//     r.begin_sequence() -> lc::optional<isize>   // element count if known (used as capacity hint)
//     r.template read_element<E>() -> lc::optional<E>   // empty once the sequence is exhausted
//     r.end_sequence();
//
// Archive failures are reported by the archive itself (e.g. by throwing); nothing is swallowed here.
// A throwing reader leaves no partially built container behind.

namespace lc
{
template <class W>
concept sequence_writer = requires(W& w) {
    w.begin_sequence(isize(0));
    w.end_sequence();
};

template <class R, class E>
concept sequence_reader = requires(R& r) {
    { r.begin_sequence() } -> std::convertible_to<lc::optional<isize>>;
    { r.template read_element<E>() } -> std::convertible_to<lc::optional<E>>;
    r.end_sequence();
};

template <sequence_writer W, class K, class V>
void serialize(W& w, lc::map<K, V> const& m)
{
    w.begin_sequence(m.size());
    for (auto const& e : m.entries())
        w.write_element(e);
    w.end_sequence();
}

template <sequence_writer W, class T>
void serialize(W& w, lc::set<T> const& s)
{
    w.begin_sequence(s.size());
    for (auto const& v : s)
        w.write_element(v);
    w.end_sequence();
}

namespace impl
{
template <class ContainerT>
struct deserializer;

template <class K, class V>
struct deserializer<lc::map<K, V>>
{
    template <class R>
    static lc::map<K, V> read(R& r)
    {
        static_assert(sequence_reader<R, lc::pair<K, V>>, "archive does not provide the sequence reader protocol");

        auto const hint = r.begin_sequence();
        auto m = lc::map<K, V>::create_with_capacity(hint.value_or(0));

        while (true)
        {
            auto e = r.template read_element<lc::pair<K, V>>();
            if (!e.has_value())
                break;
            auto&& [key, value] = lc::move(e).value();
            m.insert(lc::move(key), lc::move(value));
        }

        r.end_sequence();
        return m;
    }
};

template <class T>
struct deserializer<lc::set<T>>
{
    template <class R>
    static lc::set<T> read(R& r)
    {
        static_assert(sequence_reader<R, T>, "archive does not provide the sequence reader protocol");

        auto const hint = r.begin_sequence();
        auto s = lc::set<T>::create_with_capacity(hint.value_or(0));

        while (true)
        {
            auto v = r.template read_element<T>();
            if (!v.has_value())
                break;
            s.insert(lc::move(v).value());
        }

        r.end_sequence();
        return s;
    }
};
} // namespace impl

/// Reads a lc::map<K, V> or lc::set<T> from a sequence archive.
/// Usage:
///   auto m = lc::deserialize<lc::map<std::string, int>>(reader);
template <class ContainerT, class R>
[[nodiscard]] ContainerT deserialize(R& r)
{
    return impl::deserializer<ContainerT>::read(r);
}
} // namespace lc
