// SPDX-License-Identifier: Apache-2.0
#include <vtlayout/LayoutGeometry.h>
#include <vtlayout/logging.h>

#include <algorithm>
#include <cmath>

namespace vtlayout
{

namespace
{
    // Absorbs floating point noise when dividing pixel extents by cell extents.
    constexpr auto CellFitEpsilon = 1e-6;

    int cellsThatFit(double extent, double cellExtent) noexcept
    {
        if (cellExtent <= 0.0)
            return 1;
        return std::max(1, static_cast<int>(std::floor((extent + CellFitEpsilon) / cellExtent)));
    }
} // namespace

Rect computeContentBounds(Rect const& viewBounds, ChromeInsets const& insets) noexcept
{
    return Rect {
        .x = insets.left,
        .y = insets.bottom,
        .width = std::max(0.0, viewBounds.width - insets.left - insets.right),
        .height = std::max(0.0, viewBounds.height - insets.top - insets.bottom),
    };
}

PixelSize computeWindowSize(PixelSize optimalGridSize, ChromeInsets const& insets) noexcept
{
    return PixelSize {
        .width = optimalGridSize.width + insets.left + insets.right,
        .height = optimalGridSize.height + insets.top + insets.bottom,
    };
}

PageSize pageSizeForPixels(PixelSize area, PixelSize cellSize)
{
    auto const result = PageSize { LineCount(cellsThatFit(area.height, cellSize.height)),
                                   ColumnCount(cellsThatFit(area.width, cellSize.width)) };
    geometryLog()("{} pixels with cell size {} fit {} cells.", area, cellSize, result);
    return result;
}

ChromeInsets makeChromeInsets(double titleBarHeight, PaddingSettings const& padding) noexcept
{
    return ChromeInsets {
        .top = std::max(0.0, titleBarHeight),
        .left = std::max(0.0, padding.left),
        .right = std::max(0.0, padding.right),
        .bottom = std::max(0.0, padding.bottom),
    };
}

} // namespace vtlayout
