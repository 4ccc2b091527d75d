// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtlayout/primitives.h>

namespace vtlayout
{

/// Interface to the external terminal engine owning the character grid and the font.
///
/// The layout core only requests changes through this interface; grid contents,
/// rendering and the text shaping behind the metrics are the engine's business.
class GridEngine
{
  public:
    virtual ~GridEngine() = default;

    /// Current logical grid size.
    [[nodiscard]] virtual PageSize pageSize() const = 0;

    /// Requests the grid to adopt the given size.
    virtual void requestResize(PageSize newPageSize) = 0;

    /// Pixel size of a single grid cell with the current font.
    [[nodiscard]] virtual PixelSize cellSize() const = 0;

    /// Pixel size needed to show @p pageSize cells with the current font.
    [[nodiscard]] virtual PixelSize optimalPixelSize(PageSize pageSize) const = 0;

    [[nodiscard]] virtual FontDef font() const = 0;

    /// Applies a new font.
    ///
    /// Engines may re-derive their grid size from their current view area,
    /// so the grid size can transiently change as a side effect.
    virtual void applyFont(FontDef const& font) = 0;

    /// Informs the engine about the rectangle it is supposed to draw the grid into.
    virtual void setViewArea(Rect const& contentBounds) = 0;
};

} // namespace vtlayout
