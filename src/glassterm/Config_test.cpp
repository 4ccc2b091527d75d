// SPDX-License-Identifier: Apache-2.0
#include <glassterm/Config.h>

#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace glassterm::config;
using namespace std::chrono_literals;

namespace
{

std::filesystem::path writeTempFile(std::string const& name, std::string const& contents)
{
    auto const path = std::filesystem::temp_directory_path() / name;
    auto file = std::ofstream(path, std::ios::trunc);
    file << contents;
    return path;
}

} // namespace

TEST_CASE("Config.defaults", "[Config]")
{
    auto const config = loadConfigFromString("");

    CHECK(config.logging.empty());
    CHECK(config.font.size == 13);
    CHECK(config.layout.padding.left == 18);
    CHECK(config.layout.padding.right == 0);
    CHECK(config.layout.padding.bottom == 8);
    CHECK(config.layout.titleBar.padding == 4);
    CHECK(config.layout.titleBar.defaultHeight == 32);
    CHECK(config.layout.titleBar.tabBarIncrement == 7);
    CHECK(config.layout.scrollIndicator.hideDelay == 1500ms);
    CHECK(config.layout.tabs.closeSettleDelay == 100ms);
    CHECK(config.layout.tabs.becomeKeySettleDelay == 50ms);
    CHECK(config.layout.oscillator.interval == 30ms);
    CHECK(*config.layout.oscillator.upperBound.columns == 160);
    CHECK(config.layout.font.maximumSize == 72);
}

TEST_CASE("Config.full_document", "[Config]")
{
    auto const config = loadConfigFromString(R"(
logging: "layout.*"
font: { family: "Iosevka", default_size: 15, minimum_size: 6, maximum_size: 40 }
padding: { left: 12, right: 2, bottom: 6 }
title_bar: { padding: 3, default_height: 28, tab_bar_increment: 9 }
scroll_indicator: { width: 5, inset: 1, minimum_knob_height: 24, hide_delay: 1000, fade_in: 100, fade_out: 200 }
tabs: { close_settle_delay: 120, key_settle_delay: 40 }
oscillator:
  interval: 16
  lower: { columns: 40, lines: 10 }
  upper: { columns: 120, lines: 50 }
animate_frame_changes: false
)");

    CHECK(config.logging == "layout.*");
    CHECK(config.font.family == "Iosevka");
    CHECK(config.font.size == 15);
    CHECK(config.layout.font.defaultSize == 15);
    CHECK(config.layout.font.minimumSize == 6);
    CHECK(config.layout.font.maximumSize == 40);
    CHECK(config.layout.padding.left == 12);
    CHECK(config.layout.padding.right == 2);
    CHECK(config.layout.padding.bottom == 6);
    CHECK(config.layout.titleBar.padding == 3);
    CHECK(config.layout.titleBar.defaultHeight == 28);
    CHECK(config.layout.titleBar.tabBarIncrement == 9);
    CHECK(config.layout.scrollIndicator.width == 5);
    CHECK(config.layout.scrollIndicator.inset == 1);
    CHECK(config.layout.scrollIndicator.minimumKnobHeight == 24);
    CHECK(config.layout.scrollIndicator.hideDelay == 1000ms);
    CHECK(config.layout.scrollIndicator.fadeInDuration == 100ms);
    CHECK(config.layout.scrollIndicator.fadeOutDuration == 200ms);
    CHECK(config.layout.tabs.closeSettleDelay == 120ms);
    CHECK(config.layout.tabs.becomeKeySettleDelay == 40ms);
    CHECK(config.layout.oscillator.interval == 16ms);
    CHECK(*config.layout.oscillator.lowerBound.columns == 40);
    CHECK(*config.layout.oscillator.lowerBound.lines == 10);
    CHECK(*config.layout.oscillator.upperBound.columns == 120);
    CHECK(*config.layout.oscillator.upperBound.lines == 50);
    CHECK_FALSE(config.layout.animateFrameChanges);
}

TEST_CASE("Config.partial_section_keeps_other_defaults", "[Config]")
{
    auto const config = loadConfigFromString("padding: { left: 4 }\n");
    CHECK(config.layout.padding.left == 4);
    CHECK(config.layout.padding.bottom == 8);
    CHECK(config.layout.titleBar.padding == 4);
}

TEST_CASE("Config.unconvertible_entry_keeps_default", "[Config]")
{
    auto const config = loadConfigFromString("padding: { left: wide, bottom: 3 }\n");
    CHECK(config.layout.padding.left == 18);
    CHECK(config.layout.padding.bottom == 3);
}

TEST_CASE("Config.invalid_values_fall_back", "[Config]")
{
    auto const config = loadConfigFromString(R"(
padding: { left: -5 }
oscillator: { lower: { columns: 200, lines: 25 } }
font: { default_size: 100 }
)");

    CHECK(config.layout.padding.left == 18);
    CHECK(*config.layout.oscillator.lowerBound.columns == 80);
    CHECK(*config.layout.oscillator.upperBound.columns == 160);
    CHECK(config.layout.font.defaultSize == 13);
    CHECK(config.font.size == 72);
}

TEST_CASE("Config.negative_settle_delay_falls_back", "[Config]")
{
    auto const config = loadConfigFromString("tabs: { close_settle_delay: -20, key_settle_delay: 40 }\n");

    CHECK(config.layout.tabs.closeSettleDelay == std::chrono::milliseconds(100));
    CHECK(config.layout.tabs.becomeKeySettleDelay == std::chrono::milliseconds(50));
}

TEST_CASE("Config.corrupt_document_yields_defaults", "[Config]")
{
    auto const config = loadConfigFromString("padding: { left: [1, 2\n");
    CHECK(config.layout.padding.left == 18);
}

TEST_CASE("Config.loadConfigFromFile", "[Config]")
{
    auto const path = writeTempFile("glassterm_config_test.yml", "title_bar: { tab_bar_increment: 11 }\n");

    auto const config = loadConfigFromFile(path);
    CHECK(config.configFile == path);
    CHECK(config.layout.titleBar.tabBarIncrement == 11);

    std::filesystem::remove(path);
}

TEST_CASE("Config.missing_file_yields_defaults", "[Config]")
{
    auto const config = loadConfigFromFile(std::filesystem::temp_directory_path() / "glassterm_no_such_file.yml");
    CHECK(config.layout.titleBar.tabBarIncrement == 7);
}
