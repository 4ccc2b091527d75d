// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cctype>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace crispy
{

/// Invokes @p callback for each delimiter separated piece of @p text.
///
/// Stops early and returns false as soon as the callback returns false.
template <typename T, typename Callback>
constexpr bool split(std::basic_string_view<T> text, T delimiter, Callback const& callback)
{
    size_t a = 0;
    size_t b = 0;
    while ((b = text.find(delimiter, a)) != std::basic_string_view<T>::npos)
    {
        if (!callback(text.substr(a, b - a)))
            return false;
        a = b + 1;
    }

    if (a < text.size())
        return callback(text.substr(a));

    return true;
}

template <typename T>
auto split(std::basic_string_view<T> text, T delimiter) -> std::vector<std::basic_string_view<T>>
{
    std::vector<std::basic_string_view<T>> output {};
    split(text, delimiter, [&](auto value) {
        output.emplace_back(value);
        return true;
    });
    return output;
}

inline auto split(std::string_view text, char delimiter) -> std::vector<std::string_view>
{
    return split<char>(text, delimiter);
}

inline std::string_view trimmed(std::string_view text) noexcept
{
    auto const isSpace = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

/// Runs the given hook when going out of scope (or when run() is called explicitly).
class finally // NOLINT(readability-identifier-naming)
{
  public:
    explicit finally(std::function<void()> hook): _hook(std::move(hook)) {}

    finally(finally const&) = delete;
    finally& operator=(finally const&) = delete;
    finally(finally&&) = delete;
    finally& operator=(finally&&) = delete;

    void run()
    {
        if (_hook)
        {
            auto hooked = std::move(_hook);
            _hook = {};
            hooked();
        }
    }

    ~finally() { run(); }

  private:
    std::function<void()> _hook;
};

} // namespace crispy
