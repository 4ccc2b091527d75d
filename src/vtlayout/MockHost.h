// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtlayout/GridEngine.h>
#include <vtlayout/LayoutGeometry.h>
#include <vtlayout/ScrollIndicator.h>
#include <vtlayout/WindowHost.h>

#include <chrono>
#include <cmath>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace vtlayout
{

/// Grid engine with a trivially predictable font metric.
///
/// A cell is ceil(0.6 * size) pixels wide and ceil(1.25 * size) pixels high.
/// Like real engines, applying a font re-derives the grid size from the current view area.
class MockGridEngine: public GridEngine
{
  public:
    MockGridEngine(PageSize pageSize, FontDef font): _pageSize { pageSize }, _font { std::move(font) } {}

    [[nodiscard]] PageSize pageSize() const override { return _pageSize; }

    void requestResize(PageSize newPageSize) override
    {
        resizeRequests.push_back(newPageSize);
        _pageSize = newPageSize;
    }

    [[nodiscard]] PixelSize cellSize() const override
    {
        return PixelSize { std::ceil(_font.size * 0.6), std::ceil(_font.size * 1.25) };
    }

    [[nodiscard]] PixelSize optimalPixelSize(PageSize pageSize) const override
    {
        auto const cell = cellSize();
        return PixelSize { cell.width * unbox<double>(pageSize.columns),
                           cell.height * unbox<double>(pageSize.lines) };
    }

    [[nodiscard]] FontDef font() const override { return _font; }

    void applyFont(FontDef const& font) override
    {
        _font = font;
        ++fontChanges;
        if (!viewArea.empty())
            _pageSize = pageSizeForPixels(viewArea.size(), cellSize());
    }

    void setViewArea(Rect const& contentBounds) override
    {
        viewArea = contentBounds;
        ++viewAreaChanges;
    }

    std::vector<PageSize> resizeRequests;
    Rect viewArea {};
    int viewAreaChanges = 0;
    int fontChanges = 0;

  private:
    PageSize _pageSize;
    FontDef _font;
};

/// Window whose hosting view covers the whole window (title bar included).
class MockWindowHost: public WindowHost
{
  public:
    explicit MockWindowHost(Rect frame, std::optional<ChromeContext> initialContext = std::nullopt):
        context { initialContext }, _frame { frame }
    {
    }

    [[nodiscard]] Rect frame() const override { return _frame; }

    void setFrame(Rect const& newFrame, bool animate) override
    {
        _frame = newFrame;
        frameChanges.emplace_back(newFrame, animate);
        if (frameChanged)
            frameChanged(newFrame);
    }

    /// Simulates the user dragging the window edge. Does not notify anyone.
    void resizeByUser(PixelSize size) { _frame = anchorTopEdge(_frame, size); }

    [[nodiscard]] Rect viewBounds() const override { return Rect { 0, 0, _frame.width, _frame.height }; }

    [[nodiscard]] std::optional<ChromeContext> chromeContext() const override { return context; }

    std::optional<ChromeContext> context;
    std::vector<std::pair<Rect, bool>> frameChanges;

    /// Invoked synchronously from within setFrame(), as toolkits do with their frame change notifications.
    std::function<void(Rect const&)> frameChanged;

  private:
    Rect _frame;
};

struct MockScrollbar: public ScrollbarSource
{
    double scrollPosition = 1.0;
    double proportion = 1.0;

    [[nodiscard]] double position() const override { return scrollPosition; }
    [[nodiscard]] double knobProportion() const override { return proportion; }
};

struct MockIndicatorView: public IndicatorView
{
    struct OpacityChange
    {
        double opacity;
        std::chrono::milliseconds duration;
    };

    std::vector<Rect> frames;
    std::vector<OpacityChange> opacityChanges;

    void setFrame(Rect const& frame) override { frames.push_back(frame); }

    void animateOpacity(double opacity, std::chrono::milliseconds duration) override
    {
        opacityChanges.push_back(OpacityChange { opacity, duration });
    }

    [[nodiscard]] double opacity() const noexcept
    {
        return opacityChanges.empty() ? 0.0 : opacityChanges.back().opacity;
    }
};

} // namespace vtlayout
