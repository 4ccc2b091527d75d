// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtlayout/GridEngine.h>
#include <vtlayout/Settings.h>
#include <vtlayout/WindowHost.h>
#include <vtlayout/primitives.h>

#include <gsl/pointers>

#include <cstdint>
#include <string_view>
#include <variant>

namespace vtlayout
{

// {{{ ResizeIntent
/// The host window's frame (or its view's bounds) changed.
struct WindowFrameChanged
{
};

/// The grid is asked to adopt the given size, with the window following it.
struct GridDimensionsRequested
{
    PageSize pageSize;
};

/// A new font is to be applied, optionally keeping the grid size on screen.
struct FontChanged
{
    FontDef font;
    bool preserveGridSize = true;
};

/// The chrome insets changed (title bar or tab bar).
struct ChromeInsetsChanged
{
    ChromeInsets insets;
};

using ResizeIntent = std::variant<WindowFrameChanged, GridDimensionsRequested, FontChanged, ChromeInsetsChanged>;
// }}}

/// Serializes grid size changes and window frame changes so that neither
/// recursively triggers the other.
///
/// The coordinator is either Idle or performing a ProgrammaticUpdate. Any intent
/// arriving during a programmatic update (typically a frame change notification
/// emitted synchronously by the toolkit from within setFrame()) is ignored, as
/// the update in flight produces the next legitimate notification itself.
///
/// While the user live-resizes the window, frame changes are only observed.
/// The grid adopts the new window size once the gesture ends.
class ResizeCoordinator
{
  public:
    enum class State : uint8_t
    {
        Idle,
        ProgrammaticUpdate,
    };

    /// @param host the window hosting the view, or nullptr while detached.
    ResizeCoordinator(GridEngine& engine, WindowHost* host, Settings const& settings, ChromeInsets initialInsets);

    /// Processes a resize intent.
    ///
    /// @retval true  the intent was acted upon (or deferred until the live resize ends).
    /// @retval false the intent was ignored because an update is already in flight.
    bool process(ResizeIntent const& intent);

    void onLiveResizeBegin();
    void onLiveResizeEnd();

    [[nodiscard]] State state() const noexcept { return _state; }
    [[nodiscard]] bool inLiveResize() const noexcept { return _inLiveResize; }

    [[nodiscard]] PageSize currentPageSize() const { return _engine->pageSize(); }
    [[nodiscard]] PageSize lastKnownPageSize() const noexcept { return _lastKnownPageSize; }
    [[nodiscard]] ChromeInsets const& lastKnownInsets() const noexcept { return _lastKnownInsets; }

    /// Rectangle the grid is drawn into with the current host bounds and insets.
    [[nodiscard]] Rect contentBounds() const;

  private:
    void adoptWindowFrame();
    void applyGridDimensions(PageSize pageSize);
    void applyFont(FontDef const& font, bool preserveGridSize);
    void applyChromeInsets(ChromeInsets const& insets);

    /// Resizes the window so that it exactly fits the given grid, keeping its top edge in place.
    void fitWindowToGrid(PageSize pageSize);

    /// Derives the grid size from the current content bounds and hands both to the engine.
    void adoptContentBounds();

    gsl::not_null<GridEngine*> _engine;
    WindowHost* _host;
    bool _animateFrameChanges;
    State _state = State::Idle;
    bool _inLiveResize = false;
    bool _frameChangedDuringLiveResize = false;
    PageSize _lastKnownPageSize;
    ChromeInsets _lastKnownInsets;
};

} // namespace vtlayout

template <>
struct fmt::formatter<vtlayout::ResizeCoordinator::State>: fmt::formatter<std::string_view>
{
    auto format(vtlayout::ResizeCoordinator::State value, format_context& ctx) const
        -> format_context::iterator
    {
        using State = vtlayout::ResizeCoordinator::State;
        std::string_view name;
        switch (value)
        {
            case State::Idle: name = "Idle"; break;
            case State::ProgrammaticUpdate: name = "ProgrammaticUpdate"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};
