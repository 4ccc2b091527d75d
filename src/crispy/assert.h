// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <cstdlib>
#include <iostream>
#include <string_view>

namespace crispy
{

// Require() checks preconditions. A violation is reported on stderr and terminates the process.

namespace detail
{
    [[noreturn]] inline void fail(std::string_view text,
                                  std::string_view message,
                                  std::string_view file,
                                  int line) noexcept
    {
        std::cerr << fmt::format("[{}:{}] {} {}\n", file, line, message, text);
        std::abort();
    }
} // namespace detail

#define Require(cond)                                                                \
    do                                                                               \
    {                                                                                \
        if (!(cond))                                                                 \
        {                                                                            \
            crispy::detail::fail(#cond, "Precondition failed.", __FILE__, __LINE__); \
        }                                                                            \
    } while (0)

} // namespace crispy
