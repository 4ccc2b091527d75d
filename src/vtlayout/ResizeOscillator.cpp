// SPDX-License-Identifier: Apache-2.0
#include <vtlayout/ResizeOscillator.h>
#include <vtlayout/logging.h>

#include <crispy/assert.h>

#include <algorithm>
#include <utility>

namespace vtlayout
{

namespace
{
    constexpr int stepTowards(int value, int bound) noexcept
    {
        if (value < bound)
            return value + 1;
        if (value > bound)
            return value - 1;
        return value;
    }
} // namespace

ResizeOscillator::ResizeOscillator(ResizeCoordinator& coordinator,
                                   Scheduler& scheduler,
                                   OscillatorSettings const& settings):
    ResizeOscillator(coordinator, scheduler, settings, [&coordinator](PageSize pageSize) {
        return coordinator.process(GridDimensionsRequested { pageSize });
    })
{
}

ResizeOscillator::ResizeOscillator(ResizeCoordinator const& coordinator,
                                   Scheduler& scheduler,
                                   OscillatorSettings const& settings,
                                   RequestHandler request):
    _coordinator { &coordinator },
    _request { std::move(request) },
    _timer { scheduler },
    _interval { settings.interval },
    _lowerBound { settings.lowerBound },
    _upperBound { settings.upperBound }
{
    Require(static_cast<bool>(_request));
    Require(*_lowerBound.columns >= 1 && *_lowerBound.lines >= 1);
    Require(*_lowerBound.columns <= *_upperBound.columns);
    Require(*_lowerBound.lines <= *_upperBound.lines);
}

void ResizeOscillator::setDirection(Direction direction)
{
    if (direction == _direction)
        return;

    oscillatorLog()("Direction {} -> {}.", _direction, direction);
    auto const wasActive = active();
    _direction = direction;

    if (direction == Direction::Idle)
    {
        _timer.cancel();
        return;
    }

    if (!wasActive)
        tick();
}

PageSize ResizeOscillator::nextPageSize(PageSize current) const noexcept
{
    auto const& bound = _direction == Direction::Growing ? _upperBound : _lowerBound;

    // Clamp into the bounds first, the grid may have been resized by someone else meanwhile.
    auto const columns = std::clamp(*current.columns, *_lowerBound.columns, *_upperBound.columns);
    auto const lines = std::clamp(*current.lines, *_lowerBound.lines, *_upperBound.lines);

    return PageSize { LineCount(stepTowards(lines, *bound.lines)),
                      ColumnCount(stepTowards(columns, *bound.columns)) };
}

void ResizeOscillator::tick()
{
    if (!active())
        return;

    auto const current = _coordinator->currentPageSize();
    auto const next = nextPageSize(current);
    ++_ticks;

    oscillatorLog()("Tick #{} ({}): {} -> {}.", _ticks, _direction, current, next);
    if (!_request(next))
        oscillatorLog()("Resize request {} was not accepted.", next);

    if (_direction == Direction::Growing && next == _upperBound)
        _direction = Direction::Shrinking;
    else if (_direction == Direction::Shrinking && next == _lowerBound)
        _direction = Direction::Growing;

    scheduleNextTick();
}

void ResizeOscillator::scheduleNextTick()
{
    _timer.arm(_interval, [this]() { tick(); });
}

} // namespace vtlayout
