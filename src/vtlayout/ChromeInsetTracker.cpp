// SPDX-License-Identifier: Apache-2.0
#include <vtlayout/ChromeInsetTracker.h>
#include <vtlayout/LayoutGeometry.h>
#include <vtlayout/logging.h>

#include <algorithm>

namespace vtlayout
{

ChromeInsetTracker::ChromeInsetTracker(Settings const& settings, ChangeEvent onChange):
    _titleBar { settings.titleBar },
    _padding { settings.padding },
    _changed { std::move(onChange) },
    _insets { makeChromeInsets(_titleBar.defaultHeight, _padding) }
{
}

double ChromeInsetTracker::titleBarHeightOf(std::optional<ChromeContext> const& context) const noexcept
{
    if (!context)
        return _titleBar.defaultHeight;

    auto height = std::max(0.0, context->windowContentHeight - context->contentLayoutHeight);
    height += _titleBar.padding;
    if (context->tabCount > 1)
        height += _titleBar.tabBarIncrement;
    return height;
}

bool ChromeInsetTracker::onChromeContextChanged(std::optional<ChromeContext> const& context)
{
    if (context && (context->tabCount > 1) != (_lastTabCount > 1))
        chromeLog()("Tab bar {} (tab count {} -> {}).",
                    context->tabCount > 1 ? "appeared" : "disappeared",
                    _lastTabCount,
                    context->tabCount);

    if (context)
        _lastTabCount = std::max(1, context->tabCount);
    else
        chromeLog()("No window context available. Assuming default title bar height of {}.",
                    _titleBar.defaultHeight);

    auto const newInsets = makeChromeInsets(titleBarHeightOf(context), _padding);
    if (newInsets == _insets)
        return false;

    chromeLog()("Chrome insets changed from {} to {}.", _insets, newInsets);
    _insets = newInsets;

    if (_changed)
        _changed(_insets);

    return true;
}

} // namespace vtlayout
