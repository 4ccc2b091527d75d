// SPDX-License-Identifier: Apache-2.0
#include <vtlayout/ChromeInsetTracker.h>

#include <catch2/catch.hpp>

#include <vector>

using namespace vtlayout;

namespace
{
ChromeContext windowContext(double titleBarHeight, int tabCount = 1)
{
    return ChromeContext { .windowContentHeight = 600.0,
                           .contentLayoutHeight = 600.0 - titleBarHeight,
                           .tabCount = tabCount };
}
} // namespace

TEST_CASE("ChromeInsetTracker.defaults_without_window_context", "[ChromeInsetTracker]")
{
    auto const settings = Settings {};
    auto tracker = ChromeInsetTracker { settings };

    CHECK(tracker.currentInsets().top == 32);
    CHECK(tracker.currentInsets().left == 18);
    CHECK(tracker.currentInsets().right == 0);
    CHECK(tracker.currentInsets().bottom == 8);

    CHECK_FALSE(tracker.onChromeContextChanged(std::nullopt));
    CHECK(tracker.currentInsets().top == 32);
}

TEST_CASE("ChromeInsetTracker.title_bar_height_plus_padding", "[ChromeInsetTracker]")
{
    auto const settings = Settings {};
    auto notified = std::vector<ChromeInsets> {};
    auto tracker = ChromeInsetTracker { settings, [&](ChromeInsets const& insets) { notified.push_back(insets); } };

    CHECK(tracker.onChromeContextChanged(windowContext(30)));
    CHECK(tracker.currentInsets().top == 34);
    REQUIRE(notified.size() == 1);
    CHECK(notified.back().top == 34);

    // Same height as the default, but derived from the window.
    CHECK(tracker.onChromeContextChanged(windowContext(28)));
    CHECK(tracker.currentInsets().top == 32);
}

TEST_CASE("ChromeInsetTracker.notifies_only_on_change", "[ChromeInsetTracker]")
{
    auto const settings = Settings {};
    auto notifications = 0;
    auto tracker = ChromeInsetTracker { settings, [&](ChromeInsets const&) { ++notifications; } };

    CHECK(tracker.onChromeContextChanged(windowContext(24)));
    CHECK(tracker.currentInsets().top == 28);
    CHECK(notifications == 1);

    CHECK_FALSE(tracker.onChromeContextChanged(windowContext(24)));
    CHECK(notifications == 1);
}

TEST_CASE("ChromeInsetTracker.tab_bar_boundary", "[ChromeInsetTracker]")
{
    auto const settings = Settings {};
    auto notifications = 0;
    auto tracker = ChromeInsetTracker { settings, [&](ChromeInsets const&) { ++notifications; } };

    tracker.onChromeContextChanged(windowContext(24, 1));
    REQUIRE(tracker.currentInsets().top == 28);
    REQUIRE(notifications == 1);

    // 1 -> 2 tabs adds the increment.
    CHECK(tracker.onChromeContextChanged(windowContext(24, 2)));
    CHECK(tracker.currentInsets().top == 35);
    CHECK(tracker.lastTabCount() == 2);

    // 2 -> 3 tabs does not cross the boundary.
    CHECK_FALSE(tracker.onChromeContextChanged(windowContext(24, 3)));
    CHECK(tracker.currentInsets().top == 35);
    CHECK(tracker.lastTabCount() == 3);

    // Back to a single tab removes it again.
    CHECK(tracker.onChromeContextChanged(windowContext(24, 1)));
    CHECK(tracker.currentInsets().top == 28);
    CHECK(notifications == 3);
}

TEST_CASE("ChromeInsetTracker.configurable_constants", "[ChromeInsetTracker]")
{
    auto settings = Settings {};
    settings.titleBar.padding = 0;
    settings.titleBar.tabBarIncrement = 10;
    settings.titleBar.defaultHeight = 20;
    settings.padding.left = 4;
    auto tracker = ChromeInsetTracker { settings };

    CHECK(tracker.currentInsets().top == 20);
    CHECK(tracker.currentInsets().left == 4);

    tracker.onChromeContextChanged(windowContext(24, 2));
    CHECK(tracker.currentInsets().top == 34);
}

TEST_CASE("ChromeInsetTracker.negative_title_bar_is_clamped", "[ChromeInsetTracker]")
{
    auto const settings = Settings {};
    auto tracker = ChromeInsetTracker { settings };

    auto context = ChromeContext { .windowContentHeight = 500, .contentLayoutHeight = 520, .tabCount = 1 };
    tracker.onChromeContextChanged(context);
    CHECK(tracker.currentInsets().top == 4);
}
