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


#include "recset/foundation.hpp"
#include "recset/exceptions.hpp"
#include "recset/detail/bodies.hpp"
#include "recset/stl/unordered_set.hpp"
#include "recset/stl/vector.hpp"


template <typename Push>
static void
_push_members(rcs::value x, Push &&push)
{
  switch (x->t)
  {
    case rcs::tag::seq:
      for (const rcs::value &y : x->seq->elements)
        push(y);
      break;

    case rcs::tag::tuple:
      for (size_t i = 0; i < x->tup.len; ++i)
        push(x->tup.data[i]);
      break;

    case rcs::tag::set:
      for (const rcs::value &y : x->set->elements)
        push(y);
      break;

    case rcs::tag::map:
      for (const rcs::value &k : x->map->keys)
        push(k);
      for (const rcs::value &v : x->map->values)
        push(v);
      break;

    default:
      break;
  }
}


bool
rcs::reaches(value from, value target)
{
  if (is(from, target))
    return true;
  if (not iscontainer(from) or not iscontainer(target))
    return false;
  // Frozen containers only hold frozen containers
  if (from->frozen and not target->frozen)
    return false;

  stl::unordered_set<object*> visited;
  stl::vector<value> stack;
  stack.push_back(from);
  while (not stack.empty())
  {
    const value x = stack.back();
    stack.pop_back();
    if (is(x, target))
      return true;
    if (x->frozen and not target->frozen)
      continue;
    if (not visited.emplace(&*x).second)
      continue;
    _push_members(x, [&](value y) {
      if (iscontainer(y))
        stack.push_back(y);
    });
  }
  return false;
}


void
rcs::require_well_founded(value x, value receiver, std::string_view operation)
{
  if (reaches(x, receiver))
    throw cycle_violation_error {operation, receiver->t};
}
