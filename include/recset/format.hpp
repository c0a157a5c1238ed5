/*
 * Recset - Value-semantics recursive containers
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include "recset/value.hpp"

#include <algorithm>
#include <concepts>
#include <format>
#include <sstream>

/**
 * \file format.hpp
 * Formatting of values with std::format
 *
 * \ingroup utils
 */


namespace std {

/**
 * Formatter for rcs::value and the container handles
 *
 * Format specifiers:
 * - `{}` written form (strings quoted)
 * - `{:d}` displayed form (strings raw)
 *
 * \ingroup utils
 */
template <typename T>
  requires std::derived_from<T, rcs::value>
struct formatter<T, char> {
  enum class style { write, display } style = style::write;

  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it == 'd')
    {
      style = style::display;
      it++;
    }
    else if (it != ctx.end() and *it == 'w')
      it++;

    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for rcs::value"};

    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(const rcs::value &x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    switch (style)
    {
      case style::write: rcs::write(buffer, x); break;
      case style::display: rcs::display(buffer, x); break;
    }
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
}; // struct std::formatter<rcs::value>

} // namespace std
