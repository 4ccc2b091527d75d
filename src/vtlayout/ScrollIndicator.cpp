// SPDX-License-Identifier: Apache-2.0
#include <vtlayout/ScrollIndicator.h>
#include <vtlayout/logging.h>

#include <algorithm>

namespace vtlayout
{

Rect computeIndicatorRect(Rect const& container,
                          double scrollPosition,
                          double knobProportion,
                          ScrollIndicatorSettings const& settings) noexcept
{
    auto const position = std::clamp(scrollPosition, 0.0, 1.0);
    auto const proportion = std::clamp(knobProportion, 0.0, 1.0);

    auto const trackHeight = container.height - (settings.inset * 2);
    auto const knobHeight = std::max(trackHeight * proportion, settings.minimumKnobHeight);
    auto const travel = trackHeight - knobHeight;
    auto const knobY = container.y + settings.inset + travel * (1.0 - position);

    return Rect {
        .x = container.maxX() - settings.width - settings.inset,
        .y = knobY,
        .width = settings.width,
        .height = knobHeight,
    };
}

ScrollIndicator::ScrollIndicator(ScrollbarSource const& scrollbar,
                                 IndicatorView& view,
                                 Scheduler& scheduler,
                                 ScrollIndicatorSettings settings):
    _scrollbar { &scrollbar }, _view { &view }, _settings { settings }, _hideTimer { scheduler }
{
    _view->animateOpacity(0.0, std::chrono::milliseconds::zero());
}

void ScrollIndicator::setContainerBounds(Rect const& container)
{
    _container = container;
    updateFrame();
}

void ScrollIndicator::updateFrame()
{
    _state.visiblePosition = std::clamp(_scrollbar->position(), 0.0, 1.0);
    _state.knobProportion = std::clamp(_scrollbar->knobProportion(), 0.0, 1.0);

    auto const newFrame = computeIndicatorRect(_container, _state.visiblePosition, _state.knobProportion, _settings);
    if (newFrame == _frame)
        return;

    _frame = newFrame;
    _view->setFrame(_frame);
}

bool ScrollIndicator::onScrollInput(bool insideContainer)
{
    if (_liveResizing || !insideContainer)
        return false;

    show();
    return true;
}

void ScrollIndicator::show()
{
    _hideTimer.cancel();
    updateFrame();

    if (!_state.shown)
    {
        scrollLog()("Showing scroll indicator at {}.", _frame);
        _state.shown = true;
        _view->animateOpacity(1.0, _settings.fadeInDuration);
    }

    _hideTimer.arm(_settings.hideDelay, [this]() { hide(); });
    _state.pendingHideDeadline = _hideTimer.deadline();
}

void ScrollIndicator::hide()
{
    _state.pendingHideDeadline.reset();

    if (!_state.shown)
        return;

    scrollLog()("Hiding scroll indicator after inactivity.");
    _state.shown = false;
    _view->animateOpacity(0.0, _settings.fadeOutDuration);
}

void ScrollIndicator::hideImmediately()
{
    _hideTimer.cancel();
    _state.pendingHideDeadline.reset();
    _state.shown = false;
    _view->animateOpacity(0.0, std::chrono::milliseconds::zero());
}

void ScrollIndicator::onLiveResizeBegin()
{
    scrollLog()("Live resize begins. Hiding scroll indicator.");
    _liveResizing = true;
    hideImmediately();
}

void ScrollIndicator::onLiveResizeEnd()
{
    _liveResizing = false;
    updateFrame();
}

} // namespace vtlayout
