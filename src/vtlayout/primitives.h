// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <string>

#include <boxed-cpp/boxed.hpp>

namespace vtlayout
{

// clang-format off
namespace detail::tags
{
    struct LineCount {};
    struct ColumnCount {};
}
// clang-format on

/// ColumnCount simply represents a number of columns.
using ColumnCount = boxed::boxed<int, detail::tags::ColumnCount>;

/// LineCount represents a number of lines.
using LineCount = boxed::boxed<int, detail::tags::LineCount>;

/// Logical grid size of the terminal, in columns and lines.
struct PageSize
{
    LineCount lines;
    ColumnCount columns;
};

constexpr bool operator==(PageSize a, PageSize b) noexcept
{
    return a.lines == b.lines && a.columns == b.columns;
}

constexpr bool operator!=(PageSize a, PageSize b) noexcept
{
    return !(a == b);
}

/// Size in (possibly fractional) pixels.
struct PixelSize
{
    double width = 0.0;
    double height = 0.0;
};

constexpr bool operator==(PixelSize a, PixelSize b) noexcept
{
    return a.width == b.width && a.height == b.height;
}

/// Axis aligned rectangle in window coordinates.
///
/// The coordinate origin is the bottom-left corner, so maxY() is the top edge.
struct Rect
{
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    [[nodiscard]] constexpr double minX() const noexcept { return x; }
    [[nodiscard]] constexpr double maxX() const noexcept { return x + width; }
    [[nodiscard]] constexpr double maxY() const noexcept { return y + height; }
    [[nodiscard]] constexpr PixelSize size() const noexcept { return { width, height }; }

    [[nodiscard]] constexpr bool empty() const noexcept { return width <= 0.0 || height <= 0.0; }
};

constexpr bool operator==(Rect const& a, Rect const& b) noexcept
{
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

constexpr bool operator!=(Rect const& a, Rect const& b) noexcept
{
    return !(a == b);
}

/// Space taken away from the view by window chrome and padding.
///
/// All fields are non-negative.
struct ChromeInsets
{
    double top = 0.0;
    double left = 0.0;
    double right = 0.0;
    double bottom = 0.0;
};

constexpr bool operator==(ChromeInsets const& a, ChromeInsets const& b) noexcept
{
    return a.top == b.top && a.left == b.left && a.right == b.right && a.bottom == b.bottom;
}

constexpr bool operator!=(ChromeInsets const& a, ChromeInsets const& b) noexcept
{
    return !(a == b);
}

/// Font selection as understood by the external grid engine.
struct FontDef
{
    std::string family;
    double size = 0.0; // in points
};

inline bool operator==(FontDef const& a, FontDef const& b) noexcept
{
    return a.family == b.family && a.size == b.size;
}

/// Snapshot of the host window's chrome, as far as it affects layout.
struct ChromeContext
{
    double windowContentHeight = 0.0; //!< full content height of the window, title bar included
    double contentLayoutHeight = 0.0; //!< content height excluding the title bar
    int tabCount = 1;                 //!< number of windows in this window's tab group
};

} // namespace vtlayout

// {{{ fmt formatter
template <>
struct fmt::formatter<vtlayout::PageSize>: fmt::formatter<std::string>
{
    auto format(vtlayout::PageSize value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(
            fmt::format("{}x{}", *value.columns, *value.lines), ctx);
    }
};

template <>
struct fmt::formatter<vtlayout::PixelSize>: fmt::formatter<std::string>
{
    auto format(vtlayout::PixelSize value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(fmt::format("{}x{}", value.width, value.height), ctx);
    }
};

template <>
struct fmt::formatter<vtlayout::Rect>: fmt::formatter<std::string>
{
    auto format(vtlayout::Rect const& value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(
            fmt::format("({}, {}; {}x{})", value.x, value.y, value.width, value.height), ctx);
    }
};

template <>
struct fmt::formatter<vtlayout::ChromeInsets>: fmt::formatter<std::string>
{
    auto format(vtlayout::ChromeInsets const& value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(fmt::format("(top={}, left={}, right={}, bottom={})",
                                                          value.top,
                                                          value.left,
                                                          value.right,
                                                          value.bottom),
                                              ctx);
    }
};

template <>
struct fmt::formatter<vtlayout::FontDef>: fmt::formatter<std::string>
{
    auto format(vtlayout::FontDef const& value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(fmt::format("\"{}\" {}pt", value.family, value.size), ctx);
    }
};
// }}}
