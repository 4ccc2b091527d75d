// SPDX-License-Identifier: Apache-2.0
#include <vtlayout/LayoutGeometry.h>
#include <vtlayout/ResizeCoordinator.h>
#include <vtlayout/logging.h>

#include <crispy/overloaded.h>
#include <crispy/utils.h>

namespace vtlayout
{

ResizeCoordinator::ResizeCoordinator(GridEngine& engine,
                                     WindowHost* host,
                                     Settings const& settings,
                                     ChromeInsets initialInsets):
    _engine { &engine },
    _host { host },
    _animateFrameChanges { settings.animateFrameChanges },
    _lastKnownPageSize { engine.pageSize() },
    _lastKnownInsets { initialInsets }
{
}

Rect ResizeCoordinator::contentBounds() const
{
    if (!_host)
        return Rect {};

    return computeContentBounds(_host->viewBounds(), _lastKnownInsets);
}

bool ResizeCoordinator::process(ResizeIntent const& intent)
{
    if (_state == State::ProgrammaticUpdate)
    {
        // Insets are recorded even while an update is in flight. They take effect with the next layout pass.
        if (auto const* chrome = std::get_if<ChromeInsetsChanged>(&intent); chrome)
            _lastKnownInsets = chrome->insets;
        resizeLog()("Ignoring resize intent #{} in state {}.", intent.index(), _state);
        return false;
    }

    if (std::holds_alternative<WindowFrameChanged>(intent) && _inLiveResize)
    {
        resizeLog()("Window frame changed during live resize. Deferring grid adoption.");
        _frameChangedDuringLiveResize = true;
        return true;
    }

    _state = State::ProgrammaticUpdate;
    auto const leave = crispy::finally { [this]() {
        _state = State::Idle;
    } };

    std::visit(overloaded {
                   [this](WindowFrameChanged const&) { adoptWindowFrame(); },
                   [this](GridDimensionsRequested const& request) { applyGridDimensions(request.pageSize); },
                   [this](FontChanged const& change) { applyFont(change.font, change.preserveGridSize); },
                   [this](ChromeInsetsChanged const& change) { applyChromeInsets(change.insets); },
               },
               intent);

    return true;
}

void ResizeCoordinator::onLiveResizeBegin()
{
    resizeLog()("Live resize begins.");
    _inLiveResize = true;
    _frameChangedDuringLiveResize = false;
}

void ResizeCoordinator::onLiveResizeEnd()
{
    resizeLog()("Live resize ends.");
    _inLiveResize = false;

    if (_frameChangedDuringLiveResize && process(WindowFrameChanged {}))
        _frameChangedDuringLiveResize = false;
}

void ResizeCoordinator::adoptWindowFrame()
{
    if (!_host)
    {
        resizeLog()("Window frame changed without a host window. Nothing to adopt.");
        return;
    }

    adoptContentBounds();
}

void ResizeCoordinator::adoptContentBounds()
{
    auto const bounds = contentBounds();
    _engine->setViewArea(bounds);

    if (bounds.empty())
    {
        resizeLog()("Content bounds {} are empty. Keeping grid size {}.", bounds, _engine->pageSize());
        _lastKnownPageSize = _engine->pageSize();
        return;
    }

    auto const newPageSize = pageSizeForPixels(bounds.size(), _engine->cellSize());
    if (newPageSize != _engine->pageSize())
    {
        resizeLog()("Adopting content bounds {}: grid {} -> {}.", bounds, _engine->pageSize(), newPageSize);
        _engine->requestResize(newPageSize);
    }

    _lastKnownPageSize = _engine->pageSize();
}

void ResizeCoordinator::fitWindowToGrid(PageSize pageSize)
{
    auto const optimalSize = _engine->optimalPixelSize(pageSize);
    auto const windowSize = computeWindowSize(optimalSize, _lastKnownInsets);
    auto const oldFrame = _host->frame();
    auto const newFrame = anchorTopEdge(oldFrame, windowSize);

    resizeLog()("Fitting window to grid {} ({} pixels): frame {} -> {}.", pageSize, optimalSize, oldFrame, newFrame);
    _host->setFrame(newFrame, _animateFrameChanges);
}

void ResizeCoordinator::applyGridDimensions(PageSize pageSize)
{
    if (*pageSize.columns < 1 || *pageSize.lines < 1)
    {
        logstore::errorLog()("Refusing to resize grid to invalid size {}.", pageSize);
        return;
    }

    resizeLog()("Grid dimensions requested: {} (currently {}).", pageSize, _engine->pageSize());
    _engine->requestResize(pageSize);

    if (!_host)
    {
        _lastKnownPageSize = _engine->pageSize();
        return;
    }

    if (_inLiveResize)
        resizeLog()("Not fitting window to grid while the user resizes the window.");
    else
    {
        fitWindowToGrid(pageSize);
        _engine->setViewArea(contentBounds());
    }

    _lastKnownPageSize = _engine->pageSize();
}

void ResizeCoordinator::applyFont(FontDef const& font, bool preserveGridSize)
{
    auto const savedPageSize = _engine->pageSize();
    resizeLog()("Applying font {} ({} grid size {}).",
                font,
                preserveGridSize ? "preserving" : "not preserving",
                savedPageSize);

    _engine->applyFont(font);

    if (!_host)
    {
        if (preserveGridSize)
            _engine->requestResize(savedPageSize);
        _lastKnownPageSize = _engine->pageSize();
        return;
    }

    if (!preserveGridSize)
    {
        adoptContentBounds();
        return;
    }

    if (!_inLiveResize)
    {
        fitWindowToGrid(savedPageSize);
        _engine->setViewArea(contentBounds());
    }

    // Applying the font alone may have changed the displayed dimensions, as the cell size changed.
    _engine->requestResize(savedPageSize);
    _lastKnownPageSize = _engine->pageSize();
}

void ResizeCoordinator::applyChromeInsets(ChromeInsets const& insets)
{
    resizeLog()("Chrome insets changed: {} -> {}.", _lastKnownInsets, insets);
    _lastKnownInsets = insets;

    if (_host)
        _engine->setViewArea(contentBounds());
}

} // namespace vtlayout
