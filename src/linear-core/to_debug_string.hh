#pragma once

#include <linear-core/fwd.hh>

#include <format>
#include <iterator> // std::begin, std::end
#include <string>
#include <string_view>
#include <type_traits>
#include <utility> // std::tuple_size, std::index_sequence

namespace lc
{
struct debug_string_config
{
    // soft limit: checked before each element, so the output may overshoot by one element
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort, non-semantic, and intended only for diagnostics and test failure messages.
//
// Strategy (in order):
//   - String-likes: wrap in double quotes "..."
//   - char: wrap in single quotes '...' with escape sequences for control/non-printable chars
//   - bool and arithmetic types: std::format("{}")
//   - Use to_string(v) (ADL) if available
//   - Use v.to_string() if available
//   - Maps (key_t + mapped_t + iterable): {k0: v0, k1: v1, ...} in storage order
//   - Sets (value_t + contains + iterable): {v0, v1, ...} in storage order
//   - Other collections: [v0, v1, ...]
//   - Tuple-likes (incl. lc::pair): (v0, v1, ...)
//   - Otherwise emit raw memory dump
//
// Collections are cut off with ", ..." once the output reaches cfg.max_length.
//
// No stability, completeness, or user-facing guarantees.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
template <class T>
concept debug_map_like = requires(T const& m) {
    typename T::key_t;
    typename T::mapped_t;
    m.begin();
    m.end();
};

template <class T>
concept debug_set_like = requires(T const& s, typename T::value_t const& v) {
    { s.contains(v) } -> std::convertible_to<bool>;
    s.begin();
    s.end();
};

/// Appends the separator and one element, or the ellipsis once the output is long enough.
/// Returns false if the caller should stop.
template <class T>
bool to_debug_string_append_elem(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    s += lc::to_debug_string(v, cfg);
    return true;
}

template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    using std::get;
    (void)(lc::impl::to_debug_string_append_elem(s, get<I>(v), cfg) && ...);
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string("\"");
        s += std::string_view(v);
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");

        if (v == '\0')
            s += "\\0";
        else if (v == '\n')
            s += "\\n";
        else if (v == '\r')
            s += "\\r";
        else if (v == '\t')
            s += "\\t";
        else if (v == '\v')
            s += "\\v";
        else if (v == '\f')
            s += "\\f";
        else if (v == '\b')
            s += "\\b";
        else if (v == '\a')
            s += "\\a";
        else if (v == '\\')
            s += "\\\\";
        else if (v == '\'')
            s += "\\'";
        else if (v < 32 || v == 127)
            s += std::format("\\x{:02X}", static_cast<unsigned char>(v));
        else
            s += v;

        s += '\'';
        return s;
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        return std::format("{}", v);
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (impl::debug_map_like<T>)
    {
        auto s = std::string("{");
        for (auto&& [key, value] : v)
        {
            if (isize(s.size()) >= cfg.max_length)
            {
                s += ", ...";
                break;
            }

            if (s.size() > 1)
                s += ", ";
            s += lc::to_debug_string(key, cfg);
            s += ": ";
            s += lc::to_debug_string(value, cfg);
        }
        s += "}";
        return s;
    }
    else if constexpr (impl::debug_set_like<T>)
    {
        auto s = std::string("{");
        for (auto const& e : v)
            if (!impl::to_debug_string_append_elem(s, e, cfg))
                break;
        s += "}";
        return s;
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto const& e : v)
            if (!impl::to_debug_string_append_elem(s, e, cfg))
                break;
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        auto s = std::string("0x");
        auto const align = alignof(T);
        auto const p_v = (unsigned char const*)&v;
        for (size_t i = 0; i < sizeof(T); ++i)
        {
            if (i > 0 && i % align == 0)
                s += "_";
            s += std::format("{:02X}", p_v[i]);
        }
        return s;
    }
}
} // namespace lc
