// SPDX-License-Identifier: Apache-2.0
#include <crispy/algorithm.h>
#include <crispy/assert.h>
#include <crispy/logstore.h>
#include <crispy/utils.h>

#include <fmt/chrono.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <ostream>

namespace logstore
{

// {{{ message_builder
message_builder::message_builder(category const& cat, source_location location):
    _category { cat }, _location { location }
{
}

message_builder::~message_builder()
{
    _category.sink().write(*this);
}

std::string message_builder::message() const
{
    if (_category.get_formatter())
        return _category.get_formatter()(*this);

    if (_buffer.empty())
        return {};

    if (_buffer.back() == '\n')
        return _buffer;

    return _buffer + '\n';
}
// }}}

// {{{ category
category::category(std::string_view name,
                   std::string_view desc,
                   state state,
                   visibility visibility,
                   logstore::sink& output) noexcept:
    _name { name }, _description { desc }, _state { state }, _visibility { visibility }, _formatter {}, _sink { output }
{
    Require(get(_name) == nullptr);
    logstore::get().emplace_back(*this);
}

category::~category()
{
    auto& store = logstore::get();
    auto const i = std::find_if(store.begin(), store.end(), [this](auto const& x) { return &x.get() == this; });
    if (i != store.end())
        store.erase(i);
}

std::string category::defaultFormatter(message_builder const& message)
{
    return fmt::format("[{}:{}:{}]: {}\n",
                       message.get_category().name(),
                       message.location().file_name(),
                       message.location().line(),
                       message.text());
}
// }}}

// {{{ sink
sink::sink(bool enabled, writer wr): _enabled { enabled }, _writer { std::move(wr) }
{
}

sink::sink(bool enabled, std::ostream& output):
    sink(enabled, [out = &output](std::string_view text) {
        *out << text;
        out->flush();
    })
{
}

void sink::write(message_builder const& message)
{
    if (_enabled && message.get_category().is_enabled() && _writer)
        _writer(message.message());
}

sink& sink::console()
{
    static auto instance = sink(false, std::cout);
    return instance;
}

sink& sink::error_console() // NOLINT(readability-identifier-naming)
{
    static auto instance = sink(true, std::cerr);
    return instance;
}
// }}}

// {{{ store
std::vector<std::reference_wrapper<category>>& get()
{
    static std::vector<std::reference_wrapper<category>> store;
    return store;
}

category* get(std::string_view categoryName)
{
    for (auto const& cat: get())
        if (cat.get().name() == categoryName)
            return &cat.get();
    return nullptr;
}

void set_formatter(category::formatter const& f)
{
    for (auto const& cat: get())
        cat.get().set_formatter(f);
}

void configure(std::string_view filterString)
{
    if (filterString == "all")
    {
        for (auto& cat: get())
            cat.get().enable();
        return;
    }

    auto const filters = crispy::split(filterString, ',');
    auto const matches = [](category const& cat, std::string_view pattern) -> bool {
        pattern = crispy::trimmed(pattern);
        if (pattern.empty())
            return false;
        if (pattern.back() != '*')
            return cat.name() == pattern;
        pattern.remove_suffix(1);
        return cat.visible() && cat.name().substr(0, pattern.size()) == pattern;
    };

    for (auto& cat: get())
    {
        if (&cat.get() == &ErrorLog)
            continue;
        cat.get().enable(
            crispy::any_of(filters, [&](std::string_view pattern) { return matches(cat.get(), pattern); }));
    }
}
// }}}

void enable_console_output()
{
    sink::console().set_enabled(true);

    set_formatter([](message_builder const& msg) -> std::string {
        auto const now = std::chrono::system_clock::now();
        auto const millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

        auto result = std::string {};
        auto first = true;
        crispy::split<char>(msg.text(), '\n', [&](std::string_view line) {
            if (first)
                result += fmt::format("[{:%H:%M:%S}.{:03}] [{}] ",
                                      std::chrono::floor<std::chrono::seconds>(now),
                                      millis,
                                      msg.get_category().name());
            else
                result += "        ";
            result += line;
            result += '\n';
            first = false;
            return true;
        });
        return result;
    });
}

} // namespace logstore
