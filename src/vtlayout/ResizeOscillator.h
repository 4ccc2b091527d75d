// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtlayout/ResizeCoordinator.h>
#include <vtlayout/Scheduler.h>
#include <vtlayout/Settings.h>
#include <vtlayout/primitives.h>

#include <fmt/format.h>

#include <gsl/pointers>

#include <cstdint>
#include <functional>
#include <string_view>

namespace vtlayout
{

/// Drives the grid size back and forth between two bounds at a fixed cadence.
///
/// This is a diagnostic driver that puts the resize coordination under sustained load.
/// Each tick moves columns and lines by one towards the active bound (each clamped on its
/// own) and requests the new size, by default straight from the ResizeCoordinator.
/// Once both reach the bound, the direction flips.
class ResizeOscillator
{
  public:
    enum class Direction : uint8_t
    {
        Idle,
        Growing,
        Shrinking,
    };

    /// Issues a grid resize request. Returns whether it was accepted.
    using RequestHandler = std::function<bool(PageSize)>;

    ResizeOscillator(ResizeCoordinator& coordinator, Scheduler& scheduler, OscillatorSettings const& settings);

    /// @param request receives every resize request, so that callers can run their own
    ///                layout pass after the coordinator processed it.
    ResizeOscillator(ResizeCoordinator const& coordinator,
                     Scheduler& scheduler,
                     OscillatorSettings const& settings,
                     RequestHandler request);

    /// Starts, redirects or (with Direction::Idle) stops the oscillation.
    ///
    /// Stopping cancels the pending tick. The oscillator never resumes on its own.
    void setDirection(Direction direction);

    [[nodiscard]] Direction direction() const noexcept { return _direction; }
    [[nodiscard]] bool active() const noexcept { return _direction != Direction::Idle; }
    [[nodiscard]] PageSize lowerBound() const noexcept { return _lowerBound; }
    [[nodiscard]] PageSize upperBound() const noexcept { return _upperBound; }

    /// Number of resize requests issued since construction.
    [[nodiscard]] uint64_t tickCount() const noexcept { return _ticks; }

  private:
    void tick();
    void scheduleNextTick();

    /// Computes the next grid size one step towards the current direction's bound.
    [[nodiscard]] PageSize nextPageSize(PageSize current) const noexcept;

    gsl::not_null<ResizeCoordinator const*> _coordinator;
    RequestHandler _request;
    DeferredCallback _timer;
    Scheduler::Duration _interval;
    PageSize _lowerBound;
    PageSize _upperBound;
    Direction _direction = Direction::Idle;
    uint64_t _ticks = 0;
};

} // namespace vtlayout

template <>
struct fmt::formatter<vtlayout::ResizeOscillator::Direction>: fmt::formatter<std::string_view>
{
    auto format(vtlayout::ResizeOscillator::Direction value, format_context& ctx) const
        -> format_context::iterator
    {
        using Direction = vtlayout::ResizeOscillator::Direction;
        std::string_view name;
        switch (value)
        {
            case Direction::Idle: name = "Idle"; break;
            case Direction::Growing: name = "Growing"; break;
            case Direction::Shrinking: name = "Shrinking"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};
