// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace logstore
{

class category;
class message_builder;

using source_location = std::source_location;

/// Logging sink, such as the console or a log file.
class sink
{
  public:
    using writer = std::function<void(std::string_view)>;

    sink(bool enabled, writer writer);
    sink(bool enabled, std::ostream& output);

    void set_enabled(bool enabled) noexcept { _enabled = enabled; }
    [[nodiscard]] bool enabled() const noexcept { return _enabled; }

    /// Writes given built message to this sink, unless either the sink or the
    /// message's category is disabled.
    void write(message_builder const& message);

    static sink& console();
    static sink& error_console(); // NOLINT(readability-identifier-naming)

  private:
    bool _enabled;
    writer _writer;
};

/// Accumulates a single log message and hands it over to the category's sink
/// when going out of scope.
class message_builder
{
  public:
    explicit message_builder(category const& cat, source_location loc = source_location::current());
    message_builder(message_builder const&) = delete;
    message_builder& operator=(message_builder const&) = delete;
    ~message_builder();

    [[nodiscard]] category const& get_category() const noexcept { return _category; }
    [[nodiscard]] source_location const& location() const noexcept { return _location; }
    [[nodiscard]] std::string const& text() const noexcept { return _buffer; }

    message_builder& append(std::string_view msg)
    {
        _buffer += msg;
        return *this;
    }

    template <typename... T>
    message_builder& append(fmt::format_string<T...> fmt, T&&... args)
    {
        _buffer += fmt::vformat(fmt, fmt::make_format_args(args...));
        return *this;
    }

    message_builder& operator()(std::string_view msg) { return append(msg); }

    template <typename... T>
    message_builder& operator()(fmt::format_string<T...> fmt, T&&... args)
    {
        _buffer += fmt::vformat(fmt, fmt::make_format_args(args...));
        return *this;
    }

    /// Returns the final message text, formatted by the category's formatter (if any).
    [[nodiscard]] std::string message() const;

  private:
    category const& _category;
    source_location _location;
    std::string _buffer;
};

/// A named logging category, such as "error" or "layout.resize".
///
/// Categories register themselves in a process-wide store on construction
/// and can be toggled by name or by a prefix filter (see configure()).
class category
{
  public:
    using formatter = std::function<std::string(message_builder const&)>;

    enum class state : uint8_t
    {
        Enabled,
        Disabled
    };

    enum class visibility : uint8_t
    {
        Public,
        Hidden
    };

    category(std::string_view name,
             std::string_view desc,
             state state = state::Disabled,
             visibility visibility = visibility::Public,
             logstore::sink& output = logstore::sink::console()) noexcept;
    category(category const&) = delete;
    category& operator=(category const&) = delete;
    ~category();

    [[nodiscard]] std::string_view name() const noexcept { return _name; }
    [[nodiscard]] std::string_view description() const noexcept { return _description; }

    [[nodiscard]] bool is_enabled() const noexcept { return _state == state::Enabled; }
    void enable(bool enabled = true) noexcept { _state = enabled ? state::Enabled : state::Disabled; }

    [[nodiscard]] bool visible() const noexcept { return _visibility == visibility::Public; }

    [[nodiscard]] formatter const& get_formatter() const noexcept { return _formatter; }
    void set_formatter(formatter f) { _formatter = std::move(f); }

    void set_sink(logstore::sink& s) noexcept { _sink = s; }
    [[nodiscard]] logstore::sink& sink() const noexcept { return _sink.get(); }

    [[nodiscard]] message_builder operator()(source_location location = source_location::current()) const
    {
        return message_builder(*this, location);
    }

    static std::string defaultFormatter(message_builder const& message);

  private:
    std::string_view _name;
    std::string_view _description;
    state _state;
    visibility _visibility;
    formatter _formatter;
    std::reference_wrapper<logstore::sink> _sink;
};


std::vector<std::reference_wrapper<category>>& get();
category* get(std::string_view categoryName);
void set_formatter(category::formatter const& f);

/// Enables exactly the categories matched by the given comma separated filter.
///
/// A filter entry is either a full category name or a prefix ending in '*'.
/// The special filter "all" enables every category, including hidden ones.
/// Prefix filters never enable hidden categories. The error category stays enabled regardless.
void configure(std::string_view filterString);

/// Enables the console sink and prefixes every message with a timestamp and its category name.
void enable_console_output();

inline category ErrorLog { "error", // NOLINT
                           "Error Logger",
                           category::state::Enabled,
                           category::visibility::Public,
                           sink::error_console() };

inline message_builder errorLog(source_location location = source_location::current())
{
    return ErrorLog(location);
}

} // namespace logstore
