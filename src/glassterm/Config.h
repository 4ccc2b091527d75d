// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtlayout/Settings.h>
#include <vtlayout/primitives.h>

#include <crispy/logstore.h>

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <type_traits>

namespace glassterm::config
{

auto const inline configLog = logstore::category("layout.config", "Logs configuration file loading.");

struct Config
{
    std::filesystem::path configFile {};

    /// Log filter as understood by logstore::configure(), such as "layout.*".
    std::string logging {};

    /// Font the terminal starts with.
    vtlayout::FontDef font { "monospace", 13.0 };

    vtlayout::Settings layout {};
};

/// Reads a YAML document into a Config.
///
/// Entries that are missing or cannot be converted keep their current (default) value.
struct YAMLConfigReader
{
    std::filesystem::path configFile;
    YAML::Node doc;
    logstore::category const& logger;

    YAMLConfigReader(std::filesystem::path const& filename, logstore::category const& log);
    YAMLConfigReader(YAML::Node document, logstore::category const& log);

    void load(Config& c);

    template <typename T>
        requires std::is_scalar_v<T>
    void loadFromEntry(YAML::Node const& node, std::string const& entry, T& where)
    {
        auto const child = node[entry];
        if (!child)
            return;

        try
        {
            where = child.as<T>();
            logger()("Loading entry: {}, value {}", entry, where);
        }
        catch (YAML::Exception const& e)
        {
            logger()("Failed to load entry {}, default value {} will be used. {}", entry, where, e.what());
        }
    }

    void loadFromEntry(YAML::Node const& node, std::string const& entry, std::string& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, std::chrono::milliseconds& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, vtlayout::PageSize& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, vtlayout::FontDef& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, vtlayout::PaddingSettings& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, vtlayout::TitleBarSettings& where);
    void loadFromEntry(YAML::Node const& node,
                       std::string const& entry,
                       vtlayout::ScrollIndicatorSettings& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, vtlayout::TabSettings& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, vtlayout::OscillatorSettings& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, vtlayout::FontSettings& where);
};

/// Loads the configuration from the given file, keeping defaults for everything the file does not set.
///
/// A missing or corrupted file is reported and yields the default configuration.
Config loadConfigFromFile(std::filesystem::path const& fileName);
void loadConfigFromFile(Config& config, std::filesystem::path const& fileName);

/// Loads the configuration from an in-memory YAML document.
Config loadConfigFromString(std::string const& text);

/// Enables the log categories selected by the configuration.
void applyLogging(Config const& config);

} // namespace glassterm::config
