// SPDX-License-Identifier: Apache-2.0
#include <vtlayout/MockHost.h>
#include <vtlayout/ScrollIndicator.h>

#include <catch2/catch.hpp>

#include <algorithm>

using namespace vtlayout;
using namespace std::chrono_literals;

namespace
{

auto countFadeOuts(MockIndicatorView const& view, std::chrono::milliseconds duration)
{
    return std::count_if(view.opacityChanges.begin(), view.opacityChanges.end(), [&](auto const& change) {
        return change.opacity == 0.0 && change.duration == duration;
    });
}

struct Fixture
{
    ManualScheduler scheduler {};
    MockScrollbar scrollbar {};
    MockIndicatorView view {};
    ScrollIndicatorSettings settings {};
    ScrollIndicator indicator { scrollbar, view, scheduler, settings };

    Fixture() { indicator.setContainerBounds(Rect { 18, 8, 640, 408 }); }
};

} // namespace

TEST_CASE("ScrollIndicator.rect_at_top_and_bottom", "[ScrollIndicator]")
{
    auto const settings = ScrollIndicatorSettings {};
    auto const container = Rect { 0, 0, 20, 200 };

    auto const top = computeIndicatorRect(container, 0.0, 0.5, settings);
    CHECK(top.height == 98);
    CHECK(top.width == 6);
    CHECK(top.x == 12);
    CHECK(top.maxY() == container.maxY() - settings.inset);

    auto const bottom = computeIndicatorRect(container, 1.0, 0.5, settings);
    CHECK(bottom.height == 98);
    CHECK(bottom.y == container.y + settings.inset);
}

TEST_CASE("ScrollIndicator.rect_has_minimum_knob_height", "[ScrollIndicator]")
{
    auto const settings = ScrollIndicatorSettings {};
    auto const container = Rect { 0, 0, 20, 200 };

    CHECK(computeIndicatorRect(container, 0.0, 0.01, settings).height == 30);
    CHECK(computeIndicatorRect(container, 0.0, 0.0, settings).height == 30);
}

TEST_CASE("ScrollIndicator.rect_clamps_inputs", "[ScrollIndicator]")
{
    auto const settings = ScrollIndicatorSettings {};
    auto const container = Rect { 0, 0, 20, 200 };

    CHECK(computeIndicatorRect(container, 1.5, 0.5, settings) == computeIndicatorRect(container, 1.0, 0.5, settings));
    CHECK(computeIndicatorRect(container, -1.0, 0.5, settings) == computeIndicatorRect(container, 0.0, 0.5, settings));
    CHECK(computeIndicatorRect(container, 0.5, 3.0, settings).height == 196);
}

TEST_CASE("ScrollIndicator.starts_hidden", "[ScrollIndicator]")
{
    auto f = Fixture {};
    CHECK_FALSE(f.indicator.shown());
    CHECK(f.view.opacity() == 0.0);
    CHECK(f.scheduler.pendingCount() == 0);
}

TEST_CASE("ScrollIndicator.scroll_shows_then_hides", "[ScrollIndicator]")
{
    auto f = Fixture {};

    CHECK(f.indicator.onScrollInput(true));
    CHECK(f.indicator.shown());
    REQUIRE_FALSE(f.view.opacityChanges.empty());
    CHECK(f.view.opacityChanges.back().opacity == 1.0);
    CHECK(f.view.opacityChanges.back().duration == 150ms);
    CHECK(f.indicator.state().pendingHideDeadline == f.scheduler.now() + 1500ms);

    f.scheduler.advance(1500ms);
    CHECK_FALSE(f.indicator.shown());
    CHECK(f.view.opacityChanges.back().opacity == 0.0);
    CHECK(f.view.opacityChanges.back().duration == 300ms);
    CHECK_FALSE(f.indicator.state().pendingHideDeadline.has_value());
}

TEST_CASE("ScrollIndicator.input_outside_container_is_ignored", "[ScrollIndicator]")
{
    auto f = Fixture {};
    CHECK_FALSE(f.indicator.onScrollInput(false));
    CHECK_FALSE(f.indicator.shown());
    CHECK(f.scheduler.pendingCount() == 0);
}

TEST_CASE("ScrollIndicator.rearm_hides_after_last_input", "[ScrollIndicator]")
{
    auto f = Fixture {};
    auto const start = f.scheduler.now();

    f.indicator.onScrollInput(true);
    f.scheduler.advance(500ms);
    f.indicator.onScrollInput(true);
    CHECK(f.scheduler.pendingCount() == 1);

    // 1.5 after the first event, but only 1.0 after the second.
    f.scheduler.advance(1000ms);
    CHECK(f.indicator.shown());
    CHECK(countFadeOuts(f.view, 300ms) == 0);

    f.scheduler.advance(499ms);
    CHECK(f.indicator.shown());

    f.scheduler.advance(1ms);
    CHECK_FALSE(f.indicator.shown());
    CHECK(f.scheduler.now() - start == 2000ms);
    CHECK(countFadeOuts(f.view, 300ms) == 1);

    f.scheduler.advance(10s);
    CHECK(countFadeOuts(f.view, 300ms) == 1);
}

TEST_CASE("ScrollIndicator.burst_fades_in_once", "[ScrollIndicator]")
{
    auto f = Fixture {};

    for (auto i = 0; i < 20; ++i)
    {
        f.indicator.onScrollInput(true);
        f.scheduler.advance(10ms);
    }

    auto const fadeIns = std::count_if(f.view.opacityChanges.begin(),
                                       f.view.opacityChanges.end(),
                                       [](auto const& change) { return change.opacity == 1.0; });
    CHECK(fadeIns == 1);
    CHECK(f.scheduler.pendingCount() == 1);
}

TEST_CASE("ScrollIndicator.follows_scroll_position", "[ScrollIndicator]")
{
    auto f = Fixture {};
    f.scrollbar.proportion = 0.25;

    f.scrollbar.scrollPosition = 0.0;
    f.indicator.onScrollInput(true);
    auto const atTop = f.indicator.frame();

    f.scrollbar.scrollPosition = 1.0;
    f.indicator.onScrollInput(true);
    auto const atBottom = f.indicator.frame();

    CHECK(atTop.maxY() == 8 + 408 - 2);
    CHECK(atBottom.y == 8 + 2);
    CHECK(f.view.frames.back() == atBottom);
}

TEST_CASE("ScrollIndicator.live_resize_hides_immediately", "[ScrollIndicator]")
{
    auto f = Fixture {};
    f.indicator.onScrollInput(true);
    REQUIRE(f.indicator.shown());

    f.indicator.onLiveResizeBegin();
    CHECK_FALSE(f.indicator.shown());
    CHECK(f.indicator.suppressed());
    CHECK(f.view.opacityChanges.back().opacity == 0.0);
    CHECK(f.view.opacityChanges.back().duration == 0ms);
    CHECK(f.scheduler.pendingCount() == 0);

    CHECK_FALSE(f.indicator.onScrollInput(true));
    CHECK_FALSE(f.indicator.shown());

    f.indicator.onLiveResizeEnd();
    CHECK_FALSE(f.indicator.suppressed());
    CHECK(f.indicator.onScrollInput(true));
    CHECK(f.indicator.shown());
}
