// SPDX-License-Identifier: Apache-2.0
#include <vtlayout/ViewportController.h>
#include <vtlayout/logging.h>

#include <algorithm>

namespace vtlayout
{

ViewportController::ViewportController(GridEngine& engine,
                                       WindowHost* host,
                                       Scheduler& scheduler,
                                       Settings settings):
    _settings { std::move(settings) },
    _engine { engine },
    _host { host },
    _scheduler { scheduler },
    _chromeInsets { _settings },
    _coordinator { engine, host, _settings, _chromeInsets.currentInsets() },
    _oscillator { _coordinator,
                  scheduler,
                  _settings.oscillator,
                  [this](PageSize pageSize) { return resizeTo(pageSize); } },
    _chromeSettle { scheduler }
{
    _chromeInsets.setChangeListener([this](ChromeInsets const& insets) {
        if (_coordinator.process(ChromeInsetsChanged { insets }))
            onViewLayout();
    });

    onChromeContextChanged();
}

void ViewportController::attachScrollIndicator(ScrollbarSource const& scrollbar, IndicatorView& view)
{
    _scrollIndicator = std::make_unique<ScrollIndicator>(scrollbar, view, _scheduler, _settings.scrollIndicator);
    if (_coordinator.inLiveResize())
        _scrollIndicator->onLiveResizeBegin();
    onViewLayout();
}

// {{{ host notifications
bool ViewportController::onWindowFrameChanged()
{
    auto const accepted = _coordinator.process(WindowFrameChanged {});
    if (accepted && !_coordinator.inLiveResize())
        onViewLayout();
    return accepted;
}

bool ViewportController::onFontChanged(FontDef const& font, bool preserveGridSize)
{
    auto const accepted = _coordinator.process(FontChanged { font, preserveGridSize });
    if (accepted)
        onViewLayout();
    return accepted;
}

bool ViewportController::onChromeContextChanged()
{
    return onChromeContextChanged(_host ? _host->chromeContext() : std::nullopt);
}

bool ViewportController::onChromeContextChanged(std::optional<ChromeContext> const& context)
{
    // A direct notification supersedes any re-evaluation still waiting for the chrome to settle.
    _chromeSettle.cancel();
    return _chromeInsets.onChromeContextChanged(context);
}

bool ViewportController::onScrollInput(bool insideContainer)
{
    if (!_scrollIndicator)
        return false;

    return _scrollIndicator->onScrollInput(insideContainer);
}

void ViewportController::onLiveResizeBegin()
{
    _coordinator.onLiveResizeBegin();
    if (_scrollIndicator)
        _scrollIndicator->onLiveResizeBegin();
}

void ViewportController::onLiveResizeEnd()
{
    _coordinator.onLiveResizeEnd();
    if (_scrollIndicator)
        _scrollIndicator->onLiveResizeEnd();
    onViewLayout();
}

void ViewportController::onViewLayout()
{
    if (!_scrollIndicator)
        return;

    _scrollIndicator->setContainerBounds(_coordinator.contentBounds());
}

void ViewportController::onTabClosed()
{
    scheduleChromeReevaluation(_settings.tabs.closeSettleDelay);
}

void ViewportController::onWindowBecameKey()
{
    scheduleChromeReevaluation(_settings.tabs.becomeKeySettleDelay);
}

void ViewportController::scheduleChromeReevaluation(Scheduler::Duration delay)
{
    chromeLog()("Re-evaluating chrome in {} ms.", delay.count());
    _chromeSettle.arm(delay, [this]() {
        chromeLog()("Chrome settled. Re-evaluating.");
        _chromeInsets.onChromeContextChanged(_host ? _host->chromeContext() : std::nullopt);
    });
}
// }}}

// {{{ user actions
bool ViewportController::setFontSize(double size)
{
    auto font = _engine.font();
    auto const newSize = std::clamp(size, _settings.font.minimumSize, _settings.font.maximumSize);
    if (newSize == font.size)
        return false;

    font.size = newSize;
    return onFontChanged(font, true);
}

bool ViewportController::increaseFontSize()
{
    // Fonts picked outside the stepping range (e.g. from a font panel) are left alone.
    auto const size = _engine.font().size;
    if (size >= _settings.font.maximumSize)
        return false;

    return setFontSize(size + 1.0);
}

bool ViewportController::decreaseFontSize()
{
    auto const size = _engine.font().size;
    if (size <= _settings.font.minimumSize)
        return false;

    return setFontSize(size - 1.0);
}

bool ViewportController::resetFontSize()
{
    return setFontSize(_settings.font.defaultSize);
}

bool ViewportController::resizeTo(PageSize pageSize)
{
    auto const accepted = _coordinator.process(GridDimensionsRequested { pageSize });
    if (accepted)
        onViewLayout();
    return accepted;
}

void ViewportController::setOscillatorDirection(ResizeOscillator::Direction direction)
{
    _oscillator.setDirection(direction);
}

void ViewportController::toggleOscillator(ResizeOscillator::Direction direction)
{
    if (_oscillator.direction() == direction)
        _oscillator.setDirection(ResizeOscillator::Direction::Idle);
    else
        _oscillator.setDirection(direction);
}
// }}}

} // namespace vtlayout
