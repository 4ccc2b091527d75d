// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtlayout/Scheduler.h>
#include <vtlayout/Settings.h>
#include <vtlayout/primitives.h>

#include <gsl/pointers>

#include <chrono>
#include <optional>

namespace vtlayout
{

/// Read access to the terminal's native scrollbar, which itself stays hidden.
class ScrollbarSource
{
  public:
    virtual ~ScrollbarSource() = default;

    /// Normalized scroll position, 0.0 being the top and 1.0 the bottom of the history.
    [[nodiscard]] virtual double position() const = 0;

    /// Fraction of the whole scrollable content that is visible.
    [[nodiscard]] virtual double knobProportion() const = 0;
};

/// The custom drawn indicator, as provided by the host toolkit.
class IndicatorView
{
  public:
    virtual ~IndicatorView() = default;

    virtual void setFrame(Rect const& frame) = 0;

    /// Animates the indicator's opacity to @p opacity. A zero duration means a hard cut.
    virtual void animateOpacity(double opacity, std::chrono::milliseconds duration) = 0;
};

/// Maps the scrollbar's state onto the indicator rectangle within @p container.
///
/// The knob never gets smaller than the configured minimum height. Scroll
/// position 0 maps to the top of the track, which is the high y coordinate
/// because of the bottom-left coordinate origin.
[[nodiscard]] Rect computeIndicatorRect(Rect const& container,
                                        double scrollPosition,
                                        double knobProportion,
                                        ScrollIndicatorSettings const& settings) noexcept;

struct ScrollIndicatorState
{
    double visiblePosition = 0.0;
    double knobProportion = 1.0;
    bool shown = false;
    std::optional<Scheduler::TimePoint> pendingHideDeadline;
};

/// Auto-hiding scroll indicator.
///
/// Scroll input inside the container fades the indicator in and (re)arms a
/// single hide timer; when that timer elapses without further scroll input the
/// indicator fades out again. A live window resize hides it immediately and
/// suppresses scroll input until the resize ends.
class ScrollIndicator
{
  public:
    ScrollIndicator(ScrollbarSource const& scrollbar,
                    IndicatorView& view,
                    Scheduler& scheduler,
                    ScrollIndicatorSettings settings);

    /// Handles a scroll wheel event.
    ///
    /// @param insideContainer whether the event location lies within the terminal.
    /// @retval true the event was taken into account.
    bool onScrollInput(bool insideContainer);

    void onLiveResizeBegin();
    void onLiveResizeEnd();

    /// Sets the rectangle the indicator moves in (the grid's content bounds).
    void setContainerBounds(Rect const& container);

    /// Re-reads the scrollbar and moves the indicator accordingly.
    void updateFrame();

    [[nodiscard]] ScrollIndicatorState const& state() const noexcept { return _state; }
    [[nodiscard]] bool shown() const noexcept { return _state.shown; }
    [[nodiscard]] bool suppressed() const noexcept { return _liveResizing; }
    [[nodiscard]] Rect const& frame() const noexcept { return _frame; }

  private:
    void show();
    void hide();
    void hideImmediately();

    gsl::not_null<ScrollbarSource const*> _scrollbar;
    gsl::not_null<IndicatorView*> _view;
    ScrollIndicatorSettings _settings;
    DeferredCallback _hideTimer;
    Rect _container {};
    Rect _frame {};
    ScrollIndicatorState _state {};
    bool _liveResizing = false;
};

} // namespace vtlayout
