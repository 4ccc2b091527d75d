// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <iterator>
#include <utility>

namespace crispy
{

template <typename Container, typename Fn>
constexpr bool any_of(Container const& container, Fn&& fn)
{
    return std::any_of(std::begin(container), std::end(container), std::forward<Fn>(fn));
}

} // namespace crispy
