// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtlayout/Settings.h>
#include <vtlayout/primitives.h>

namespace vtlayout
{

/// Computes the sub-rectangle of the view the grid is drawn into.
///
/// A view smaller than its insets yields a zero sized rectangle.
[[nodiscard]] Rect computeContentBounds(Rect const& viewBounds, ChromeInsets const& insets) noexcept;

/// Computes the outer window size needed to show a grid of the given pixel size.
[[nodiscard]] PixelSize computeWindowSize(PixelSize optimalGridSize, ChromeInsets const& insets) noexcept;

/// Resizes @p frame to @p newSize while keeping its top-left corner in place.
///
/// With a bottom-left coordinate origin this keeps minX() and maxY() fixed,
/// growing or shrinking the frame downwards.
[[nodiscard]] constexpr Rect anchorTopEdge(Rect const& frame, PixelSize newSize) noexcept
{
    return Rect {
        .x = frame.x,
        .y = frame.maxY() - newSize.height,
        .width = newSize.width,
        .height = newSize.height,
    };
}

/// Computes how many grid cells of @p cellSize fit into @p area.
///
/// The result is never smaller than 1x1.
[[nodiscard]] PageSize pageSizeForPixels(PixelSize area, PixelSize cellSize);

/// Constructs the insets for a title bar of the given height using the configured paddings.
[[nodiscard]] ChromeInsets makeChromeInsets(double titleBarHeight, PaddingSettings const& padding) noexcept;

} // namespace vtlayout
