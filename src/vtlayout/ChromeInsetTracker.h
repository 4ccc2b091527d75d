// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtlayout/Settings.h>
#include <vtlayout/primitives.h>

#include <functional>
#include <optional>

namespace vtlayout
{

/// Keeps track of the space the title bar and tab bar take away from the terminal view.
///
/// The top inset is the title bar height (as reported by the host) plus a fixed
/// padding, plus another fixed increment while the window's tab group shows
/// more than one tab. Left, right and bottom insets are constant paddings.
class ChromeInsetTracker
{
  public:
    using ChangeEvent = std::function<void(ChromeInsets const&)>;

    explicit ChromeInsetTracker(Settings const& settings, ChangeEvent onChange = {});

    [[nodiscard]] ChromeInsets const& currentInsets() const noexcept { return _insets; }
    [[nodiscard]] int lastTabCount() const noexcept { return _lastTabCount; }

    /// Recomputes the insets from the given chrome context.
    ///
    /// Without a context, the default title bar height is assumed.
    /// The change listener is only invoked if the insets actually changed.
    ///
    /// @retval true the insets changed.
    bool onChromeContextChanged(std::optional<ChromeContext> const& context);

    void setChangeListener(ChangeEvent onChange) { _changed = std::move(onChange); }

  private:
    [[nodiscard]] double titleBarHeightOf(std::optional<ChromeContext> const& context) const noexcept;

    TitleBarSettings _titleBar;
    PaddingSettings _padding;
    ChangeEvent _changed;
    ChromeInsets _insets;
    int _lastTabCount = 1;
};

} // namespace vtlayout
