// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtlayout/ChromeInsetTracker.h>
#include <vtlayout/GridEngine.h>
#include <vtlayout/ResizeCoordinator.h>
#include <vtlayout/ResizeOscillator.h>
#include <vtlayout/Scheduler.h>
#include <vtlayout/ScrollIndicator.h>
#include <vtlayout/Settings.h>
#include <vtlayout/WindowHost.h>

#include <memory>
#include <optional>

namespace vtlayout
{

/// Entry point of the layout core for the surrounding application.
///
/// Owns the chrome inset tracker, the resize coordinator, the resize oscillator
/// and (once attached) the scroll indicator, and routes the host toolkit's
/// notifications to them. Chrome inset changes flow from the tracker into the
/// coordinator. All calls must happen on the UI thread.
class ViewportController
{
  public:
    /// @param host the window hosting the terminal view, or nullptr while detached.
    ViewportController(GridEngine& engine, WindowHost* host, Scheduler& scheduler, Settings settings = {});

    ViewportController(ViewportController const&) = delete;
    ViewportController& operator=(ViewportController const&) = delete;

    /// Attaches the auto-hiding scroll indicator.
    ///
    /// Both references must outlive this controller.
    void attachScrollIndicator(ScrollbarSource const& scrollbar, IndicatorView& view);

    // {{{ host notifications
    bool onWindowFrameChanged();
    bool onFontChanged(FontDef const& font, bool preserveGridSize);

    /// Re-reads the chrome context from the host window.
    bool onChromeContextChanged();
    bool onChromeContextChanged(std::optional<ChromeContext> const& context);

    bool onScrollInput(bool insideContainer);
    void onLiveResizeBegin();
    void onLiveResizeEnd();

    /// Layout pass of the hosting view. Refreshes the scroll indicator's geometry.
    void onViewLayout();

    /// A tab of this window's tab group was closed.
    ///
    /// The chrome is re-evaluated after a short settle delay, as the tab bar
    /// disappears asynchronously.
    void onTabClosed();

    /// The window became the key window. Re-evaluates the chrome after a short settle delay.
    void onWindowBecameKey();
    // }}}

    // {{{ user actions
    bool increaseFontSize();
    bool decreaseFontSize();
    bool resetFontSize();

    /// Resizes the grid (and with it the window) to the given size.
    bool resizeTo(PageSize pageSize);

    void setOscillatorDirection(ResizeOscillator::Direction direction);

    /// Activates the given direction, or stops the oscillator if it is already running that way.
    void toggleOscillator(ResizeOscillator::Direction direction);
    // }}}

    [[nodiscard]] Settings const& settings() const noexcept { return _settings; }
    [[nodiscard]] ChromeInsetTracker const& chromeInsets() const noexcept { return _chromeInsets; }
    [[nodiscard]] ResizeCoordinator const& coordinator() const noexcept { return _coordinator; }
    [[nodiscard]] ResizeOscillator const& oscillator() const noexcept { return _oscillator; }
    [[nodiscard]] ScrollIndicator const* scrollIndicator() const noexcept { return _scrollIndicator.get(); }
    [[nodiscard]] bool chromeReevaluationPending() const noexcept { return _chromeSettle.pending(); }

  private:
    bool setFontSize(double size);
    void scheduleChromeReevaluation(Scheduler::Duration delay);

    Settings _settings;
    GridEngine& _engine;
    WindowHost* _host;
    Scheduler& _scheduler;
    ChromeInsetTracker _chromeInsets;
    ResizeCoordinator _coordinator;
    ResizeOscillator _oscillator;
    DeferredCallback _chromeSettle;
    std::unique_ptr<ScrollIndicator> _scrollIndicator;
};

} // namespace vtlayout
