// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtlayout/primitives.h>

#include <chrono>

namespace vtlayout
{

// The pixel values below are empirical visual constants.

struct PaddingSettings
{
    double left = 18.0;
    double right = 0.0;
    double bottom = 8.0;
};

struct TitleBarSettings
{
    double padding = 4.0;        //!< breathing room below the title bar
    double defaultHeight = 32.0; //!< used without window context, padding included
    double tabBarIncrement = 7.0;
};

struct ScrollIndicatorSettings
{
    double width = 6.0;
    double inset = 2.0;
    double minimumKnobHeight = 30.0;
    std::chrono::milliseconds hideDelay { 1500 };
    std::chrono::milliseconds fadeInDuration { 150 };
    std::chrono::milliseconds fadeOutDuration { 300 };
};

struct TabSettings
{
    std::chrono::milliseconds closeSettleDelay { 100 };
    std::chrono::milliseconds becomeKeySettleDelay { 50 };
};

struct OscillatorSettings
{
    std::chrono::milliseconds interval { 30 };
    PageSize lowerBound { LineCount(25), ColumnCount(80) };
    PageSize upperBound { LineCount(60), ColumnCount(160) };
};

struct FontSettings
{
    double defaultSize = 13.0;
    double minimumSize = 5.0;
    double maximumSize = 72.0;
};

/// Tunables of the viewport layout.
struct Settings
{
    PaddingSettings padding;
    TitleBarSettings titleBar;
    ScrollIndicatorSettings scrollIndicator;
    TabSettings tabs;
    OscillatorSettings oscillator;
    FontSettings font;
    bool animateFrameChanges = true;
};

} // namespace vtlayout
