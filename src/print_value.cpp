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


#include "recset/value.hpp"
#include "recset/set.hpp"
#include "recset/map.hpp"
#include "recset/tuple.hpp"

#include <cmath>
#include <format>
#include <sstream>


enum class mode {
  write,
  display,
};


static void
_print(mode mode, std::ostream &os, rcs::value val);


static void
_print_number(std::ostream &os, double x)
{
  // Integers up to 2^53 are exact in a double
  if (std::trunc(x) == x and std::fabs(x) < 9007199254740992.0)
    os << std::format("{}", static_cast<int64_t>(x));
  else
    os << std::format("{}", x);
}


static void
_print_string(mode mode, std::ostream &os, std::string_view s)
{
  if (mode == mode::display)
  {
    os << s;
    return;
  }

  os << '"';
  for (const char c : s)
  {
    switch (c)
    {
      case '"':
      case '\\':
        os.put('\\');
        os.put(c);
        break;

      case '\n':
        os << "\\n";
        break;

      case '\t':
        os << "\\t";
        break;

      default:
        if (static_cast<unsigned char>(c) < 0x20 or c == '\x7f')
          os << std::format("\\x{:02x}", int(static_cast<unsigned char>(c)));
        else
          os.put(c);
    }
  }
  os << '"';
}


template <typename Range>
static void
_print_elements(mode mode, std::ostream &os, const Range &elements, char open,
                char close)
{
  os << open;
  bool first = true;
  for (const rcs::value &x : elements)
  {
    if (not first)
      os << ", ";
    _print(mode, os, x);
    first = false;
  }
  os << close;
}


static void
_print(mode mode, std::ostream &os, rcs::value val)
{
  using namespace rcs;

  switch (val->t)
  {
    case tag::num:
      _print_number(os, val->num);
      break;

    case tag::str:
      _print_string(mode, os, str_view(val));
      break;

    case tag::seq:
      _print_elements(mode, os, val->seq->elements, '[', ']');
      break;

    case tag::tuple:
      _print_elements(mode, os, as_tuple(val), '(', ')');
      break;

    case tag::set:
      // Canonical order so that equal sets print identically
      _print_elements(mode, os, as_set(val).sorted(), '{', '}');
      break;

    case tag::map:
    {
      const stl::vector<map::entry> entries = as_map(val).entries();
      if (entries.empty())
      {
        os << "{=>}";
        break;
      }
      os << '{';
      bool first = true;
      for (const auto &[k, v] : entries)
      {
        if (not first)
          os << ", ";
        _print(mode, os, k);
        os << " => ";
        _print(mode, os, v);
        first = false;
      }
      os << '}';
      break;
    }
  }
}


void
rcs::write(std::ostream &os, value x)
{ _print(mode::write, os, x); }


void
rcs::display(std::ostream &os, value x)
{ _print(mode::display, os, x); }


std::string
rcs::to_string(value x)
{
  std::ostringstream buffer;
  write(buffer, x);
  return std::move(buffer).str();
}
