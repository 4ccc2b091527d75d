// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtlayout/primitives.h>

#include <optional>

namespace vtlayout
{

/// Interface to the host toolkit's window that embeds the terminal view.
class WindowHost
{
  public:
    virtual ~WindowHost() = default;

    /// Outer window frame in screen coordinates (bottom-left origin).
    [[nodiscard]] virtual Rect frame() const = 0;

    /// Applies a new window frame.
    ///
    /// Toolkits commonly emit frame change notifications synchronously from
    /// within this call.
    virtual void setFrame(Rect const& newFrame, bool animate) = 0;

    /// Bounds of the terminal's hosting view, in view coordinates.
    [[nodiscard]] virtual Rect viewBounds() const = 0;

    /// Title bar and tab group state, or nothing while no such context is available
    /// (e.g. the window is detached or offscreen).
    [[nodiscard]] virtual std::optional<ChromeContext> chromeContext() const = 0;
};

} // namespace vtlayout
