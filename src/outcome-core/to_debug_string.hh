#pragma once

#include <outcome-core/fwd.hh>
#include <outcome-core/native.hh>
#include <outcome-core/to_string.hh>
#include <outcome-core/utility.hh>

#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility> // for tuple_size

namespace oc
{
struct debug_string_config
{
    // soft limit, the element that crosses it is still rendered
    isize max_length = 100;
};

// Renders a success value for the to_string() of outcomes.
// Diagnostics only: the output is not stable and may be lossy.
//
// First match wins:
//   string-likes      "..."
//   char              '...' with escapes for control characters
//   to_string(v)      found by ADL
//   v.to_string()
//   smart pointers    address of the pointee, 0x0 when empty
//   ranges            [v0, v1, ...]
//   tuple-likes       (v0, v1, ...)
//   anything else     <demangled type name>
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});
} // namespace oc

namespace oc::impl
{
inline void append_escaped_char(std::string& s, char c)
{
    switch (c)
    {
    case '\0': s += "\\0"; return;
    case '\n': s += "\\n"; return;
    case '\r': s += "\\r"; return;
    case '\t': s += "\\t"; return;
    case '\v': s += "\\v"; return;
    case '\f': s += "\\f"; return;
    case '\b': s += "\\b"; return;
    case '\a': s += "\\a"; return;
    case '\\': s += "\\\\"; return;
    case '\'': s += "\\'"; return;
    default: break;
    }

    if (c >= 32 && c != 127)
    {
        s += c;
        return;
    }

    constexpr char digits[] = "0123456789ABCDEF";
    auto const u = static_cast<unsigned char>(c);
    s += "\\x";
    s += digits[u >> 4];
    s += digits[u & 0xF];
}

/// Appends the separator and the element, or the ellipsis once s has reached the limit
/// Returns false after the ellipsis
template <class T>
bool append_debug_element(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";
    s += oc::to_debug_string(v, cfg);
    return true;
}

template <class T, std::size_t... I>
void append_debug_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    (void)(oc::impl::append_debug_element(s, std::get<I>(v), cfg) && ...);
}
} // namespace oc::impl

template <class T>
std::string oc::to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string("\"");
        s += std::string_view(v);
        s += '"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");
        oc::impl::append_escaped_char(s, v);
        s += '\'';
        return s;
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires { static_cast<void const*>(v.get()); })
    {
        return oc::to_string(static_cast<void const*>(v.get()));
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto&& e : v)
            if (!oc::impl::append_debug_element(s, e, cfg))
                break;
        s += ']';
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        oc::impl::append_debug_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ')';
        return s;
    }
    else
    {
        return '<' + oc::demangle_symbol(typeid(T).name()) + '>';
    }
}
