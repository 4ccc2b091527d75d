// SPDX-License-Identifier: Apache-2.0
#include <glassterm/Config.h>

#include <crispy/utils.h>

#include <fmt/format.h>

#include <algorithm>

namespace glassterm::config
{

using vtlayout::ColumnCount;
using vtlayout::LineCount;
using vtlayout::PageSize;

namespace
{
    template <typename T>
    void keepIfNegative(T& where, T fallback, std::string_view entry)
    {
        if (where < T {})
        {
            logstore::errorLog()(
                "Configuration entry {} must not be negative. Using {} instead.", entry, fallback);
            where = fallback;
        }
    }

    void validate(vtlayout::ScrollIndicatorSettings& s)
    {
        auto const defaults = vtlayout::ScrollIndicatorSettings {};
        keepIfNegative(s.width, defaults.width, "scroll_indicator.width");
        keepIfNegative(s.inset, defaults.inset, "scroll_indicator.inset");
        keepIfNegative(s.minimumKnobHeight, defaults.minimumKnobHeight, "scroll_indicator.minimum_knob_height");
        if (s.hideDelay.count() < 0 || s.fadeInDuration.count() < 0 || s.fadeOutDuration.count() < 0)
        {
            logstore::errorLog()("Scroll indicator timings must not be negative. Using defaults.");
            s.hideDelay = defaults.hideDelay;
            s.fadeInDuration = defaults.fadeInDuration;
            s.fadeOutDuration = defaults.fadeOutDuration;
        }
    }

    void validate(vtlayout::TabSettings& s)
    {
        if (s.closeSettleDelay.count() >= 0 && s.becomeKeySettleDelay.count() >= 0)
            return;

        auto const defaults = vtlayout::TabSettings {};
        logstore::errorLog()("Tab settle delays must not be negative. Using {} ms and {} ms.",
                             defaults.closeSettleDelay.count(),
                             defaults.becomeKeySettleDelay.count());
        s = defaults;
    }

    void validate(vtlayout::OscillatorSettings& s)
    {
        auto const valid = *s.lowerBound.columns >= 1 && *s.lowerBound.lines >= 1
                           && *s.lowerBound.columns <= *s.upperBound.columns
                           && *s.lowerBound.lines <= *s.upperBound.lines && s.interval.count() > 0;
        if (valid)
            return;

        auto const defaults = vtlayout::OscillatorSettings {};
        logstore::errorLog()("Invalid oscillator bounds [{}, {}] or interval {} ms. Using [{}, {}] every {} ms.",
                             s.lowerBound,
                             s.upperBound,
                             s.interval.count(),
                             defaults.lowerBound,
                             defaults.upperBound,
                             defaults.interval.count());
        s = defaults;
    }

    void validate(vtlayout::FontSettings& s)
    {
        if (s.minimumSize > 0.0 && s.minimumSize <= s.defaultSize && s.defaultSize <= s.maximumSize)
            return;

        auto const defaults = vtlayout::FontSettings {};
        logstore::errorLog()("Invalid font size range {} <= {} <= {}. Using {} <= {} <= {}.",
                             s.minimumSize,
                             s.defaultSize,
                             s.maximumSize,
                             defaults.minimumSize,
                             defaults.defaultSize,
                             defaults.maximumSize);
        s = defaults;
    }
} // namespace

// {{{ YAMLConfigReader
YAMLConfigReader::YAMLConfigReader(std::filesystem::path const& filename, logstore::category const& log):
    configFile(filename), logger { log }
{
    try
    {
        doc = YAML::LoadFile(configFile.string());
    }
    catch (YAML::Exception const& e)
    {
        logstore::errorLog()("Configuration file {} is corrupted. {}\nDefault config will be loaded.",
                             configFile.string(),
                             e.what());
    }
}

YAMLConfigReader::YAMLConfigReader(YAML::Node document, logstore::category const& log):
    doc { std::move(document) }, logger { log }
{
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node, std::string const& entry, std::string& where)
{
    auto const child = node[entry];
    if (!child)
        return;

    try
    {
        where = child.as<std::string>();
        logger()("Loading entry: {}, value {}", entry, where);
    }
    catch (YAML::Exception const& e)
    {
        logger()("Failed to load entry {}, default value will be used. {}", entry, e.what());
    }
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node,
                                     std::string const& entry,
                                     std::chrono::milliseconds& where)
{
    auto count = where.count();
    loadFromEntry(node, entry, count);
    where = std::chrono::milliseconds(count);
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node, std::string const& entry, PageSize& where)
{
    auto const child = node[entry];
    if (!child)
        return;

    auto columns = *where.columns;
    auto lines = *where.lines;
    loadFromEntry(child, "columns", columns);
    loadFromEntry(child, "lines", lines);
    where = PageSize { LineCount(lines), ColumnCount(columns) };
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node, std::string const& entry, vtlayout::FontDef& where)
{
    auto const child = node[entry];
    if (!child)
        return;

    loadFromEntry(child, "family", where.family);
    loadFromEntry(child, "default_size", where.size);
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node,
                                     std::string const& entry,
                                     vtlayout::PaddingSettings& where)
{
    auto const child = node[entry];
    if (!child)
        return;

    auto const defaults = vtlayout::PaddingSettings {};
    loadFromEntry(child, "left", where.left);
    loadFromEntry(child, "right", where.right);
    loadFromEntry(child, "bottom", where.bottom);
    keepIfNegative(where.left, defaults.left, "padding.left");
    keepIfNegative(where.right, defaults.right, "padding.right");
    keepIfNegative(where.bottom, defaults.bottom, "padding.bottom");
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node,
                                     std::string const& entry,
                                     vtlayout::TitleBarSettings& where)
{
    auto const child = node[entry];
    if (!child)
        return;

    auto const defaults = vtlayout::TitleBarSettings {};
    loadFromEntry(child, "padding", where.padding);
    loadFromEntry(child, "default_height", where.defaultHeight);
    loadFromEntry(child, "tab_bar_increment", where.tabBarIncrement);
    keepIfNegative(where.padding, defaults.padding, "title_bar.padding");
    keepIfNegative(where.defaultHeight, defaults.defaultHeight, "title_bar.default_height");
    keepIfNegative(where.tabBarIncrement, defaults.tabBarIncrement, "title_bar.tab_bar_increment");
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node,
                                     std::string const& entry,
                                     vtlayout::ScrollIndicatorSettings& where)
{
    auto const child = node[entry];
    if (!child)
        return;

    loadFromEntry(child, "width", where.width);
    loadFromEntry(child, "inset", where.inset);
    loadFromEntry(child, "minimum_knob_height", where.minimumKnobHeight);
    loadFromEntry(child, "hide_delay", where.hideDelay);
    loadFromEntry(child, "fade_in", where.fadeInDuration);
    loadFromEntry(child, "fade_out", where.fadeOutDuration);
    validate(where);
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node,
                                     std::string const& entry,
                                     vtlayout::TabSettings& where)
{
    auto const child = node[entry];
    if (!child)
        return;

    loadFromEntry(child, "close_settle_delay", where.closeSettleDelay);
    loadFromEntry(child, "key_settle_delay", where.becomeKeySettleDelay);
    validate(where);
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node,
                                     std::string const& entry,
                                     vtlayout::OscillatorSettings& where)
{
    auto const child = node[entry];
    if (!child)
        return;

    loadFromEntry(child, "interval", where.interval);
    loadFromEntry(child, "lower", where.lowerBound);
    loadFromEntry(child, "upper", where.upperBound);
    validate(where);
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node,
                                     std::string const& entry,
                                     vtlayout::FontSettings& where)
{
    auto const child = node[entry];
    if (!child)
        return;

    loadFromEntry(child, "default_size", where.defaultSize);
    loadFromEntry(child, "minimum_size", where.minimumSize);
    loadFromEntry(child, "maximum_size", where.maximumSize);
    validate(where);
}

void YAMLConfigReader::load(Config& c)
{
    if (!doc || !doc.IsMap())
    {
        logger()("Configuration document is empty. Using defaults.");
        return;
    }

    loadFromEntry(doc, "logging", c.logging);
    loadFromEntry(doc, "font", c.font);
    loadFromEntry(doc, "font", c.layout.font);
    loadFromEntry(doc, "padding", c.layout.padding);
    loadFromEntry(doc, "title_bar", c.layout.titleBar);
    loadFromEntry(doc, "scroll_indicator", c.layout.scrollIndicator);
    loadFromEntry(doc, "tabs", c.layout.tabs);
    loadFromEntry(doc, "oscillator", c.layout.oscillator);
    loadFromEntry(doc, "animate_frame_changes", c.layout.animateFrameChanges);

    c.font.size = std::clamp(c.font.size, c.layout.font.minimumSize, c.layout.font.maximumSize);
}
// }}}

Config loadConfigFromFile(std::filesystem::path const& fileName)
{
    Config config {};

    loadConfigFromFile(config, fileName);

    return config;
}

void loadConfigFromFile(Config& config, std::filesystem::path const& fileName)
{
    configLog()("Loading configuration from file: {}", fileName.string());
    config.configFile = fileName;

    std::error_code ec;
    if (!std::filesystem::exists(fileName, ec))
    {
        logstore::errorLog()("Configuration file {} does not exist. Default config will be loaded.",
                             fileName.string());
        return;
    }

    auto reader = YAMLConfigReader(fileName, configLog);
    reader.load(config);
}

Config loadConfigFromString(std::string const& text)
{
    Config config {};

    YAML::Node doc;
    try
    {
        doc = YAML::Load(text);
    }
    catch (YAML::Exception const& e)
    {
        logstore::errorLog()("Configuration is corrupted. {}\nDefault config will be loaded.", e.what());
        return config;
    }

    auto reader = YAMLConfigReader(std::move(doc), configLog);
    reader.load(config);
    return config;
}

void applyLogging(Config const& config)
{
    auto const filter = crispy::trimmed(config.logging);
    if (filter.empty())
        return;

    configLog()("Enabling log categories: {}", filter);
    logstore::configure(filter);
}

} // namespace glassterm::config
