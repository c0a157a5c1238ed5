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

#include <cmath>
#include <exception>


std::string_view
rcs::tag_name(tag t) noexcept
{
  switch (t)
  {
    case tag::num: return "number";
    case tag::str: return "string";
    case tag::seq: return "sequence";
    case tag::tuple: return "tuple";
    case tag::set: return "set";
    case tag::map: return "map";
  }
  std::terminate();
}


bool
rcs::is_storable(value x) noexcept
{ return not isnum(x) or std::isfinite(x->num); }
