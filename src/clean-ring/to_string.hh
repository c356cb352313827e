#pragma once

#include <clean-ring/fwd.hh>
#include <clean-ring/utility.hh>

#include <algorithm>
#include <concepts>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

namespace cr
{
// "original" / "reverse"
[[nodiscard]] std::string to_string(sequence_direction dir);

// Renders all elements starting at the focus in original order: "[e0, e1, ..., en]"
// Empty zippers render as "[]".
// Each element is rendered by (in order):
//   - std::format("{}", e) if a std::formatter exists
//   - to_string(e) found via ADL
//   - e.to_string()
template <class T>
[[nodiscard]] std::string to_string(ring_zipper<T> const& zipper);

//
// Implementation
//

namespace impl
{
// disabled std::formatter specializations are not default constructible
template <class T>
concept has_std_formatter = std::is_default_constructible_v<std::formatter<std::remove_cvref_t<T>, char>>;

template <class T>
void append_display(std::string& s, T const& v)
{
    if constexpr (has_std_formatter<T>)
        std::format_to(std::back_inserter(s), "{}", v);
    else if constexpr (requires { { to_string(v) } -> std::convertible_to<std::string_view>; })
        s += std::string_view(to_string(v));
    else if constexpr (requires { { v.to_string() } -> std::convertible_to<std::string_view>; })
        s += std::string_view(v.to_string());
    else
        static_assert(cr::always_false_t<T>, "element type cannot be rendered (needs std::formatter, to_string(v) or v.to_string())");
}
} // namespace impl

template <class T>
std::string to_string(ring_zipper<T> const& zipper)
{
    auto s = std::string("[");
    auto first = true;
    for (auto const& e : zipper.iter())
    {
        if (!first)
            s += ", ";
        first = false;
        impl::append_display(s, e);
    }
    s += ']';
    return s;
}
} // namespace cr

/// std::format support, same output as cr::to_string
/// Usage:
///   std::format("tabs: {}", zipper); // "tabs: [b, c, a]"
template <class T>
struct std::formatter<cr::ring_zipper<T>, char>
{
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    template <class FormatContext>
    auto format(cr::ring_zipper<T> const& zipper, FormatContext& ctx) const
    {
        auto const s = cr::to_string(zipper);
        return std::copy(s.begin(), s.end(), ctx.out());
    }
};

template <>
struct std::formatter<cr::sequence_direction, char> : std::formatter<std::string_view, char>
{
    template <class FormatContext>
    auto format(cr::sequence_direction dir, FormatContext& ctx) const
    {
        return std::formatter<std::string_view, char>::format(cr::to_string(dir), ctx);
    }
};
