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


#include "recset/utilities/execution_timer.hpp"
#include "recset/value.hpp"
#include "recset/detail/bodies.hpp"


static bool
_equal_arrays(const rcs::value *a, const rcs::value *b, size_t n)
{
  for (size_t i = 0; i < n; ++i)
  {
    if (not equal(a[i], b[i]))
      return false;
  }
  return true;
}

static bool
_equal_sets(const rcs::detail::set_body &a, const rcs::detail::set_body &b)
{
  for (size_t i = 0; i < a.elements.size(); ++i)
  {
    if (not b.find(a.elements[i], a.hashes[i]).found())
      return false;
  }
  return true;
}

static bool
_equal_maps(const rcs::detail::map_body &a, const rcs::detail::map_body &b)
{
  for (size_t i = 0; i < a.keys.size(); ++i)
  {
    const rcs::detail::probe_result r = b.find(a.keys[i], a.hashes[i]);
    if (not r.found() or not equal(a.values[i], b.values[r.index]))
      return false;
  }
  return true;
}


bool
rcs::equal(value a, value b)
{
  if (is(a, b))
    return true;

  if (a->t != b->t)
    return false;

  switch (a->t)
  {
    case tag::num:
      return a->num == b->num;

    case tag::str:
      return str_view(a) == str_view(b);

    default:
      break;
  }

  RECSET_FUNCTION_BENCHMARK

  // Containers: equal contents imply equal hashes
  if (hash(a) != hash(b))
    return false;

  switch (a->t)
  {
    case tag::seq:
    {
      const auto &ae = a->seq->elements, &be = b->seq->elements;
      return ae.size() == be.size() and
             _equal_arrays(ae.data(), be.data(), ae.size());
    }

    case tag::tuple:
      return a->tup.len == b->tup.len and
             _equal_arrays(a->tup.data, b->tup.data, a->tup.len);

    case tag::set:
      return a->set->elements.size() == b->set->elements.size() and
             _equal_sets(*a->set, *b->set);

    case tag::map:
      return a->map->keys.size() == b->map->keys.size() and
             _equal_maps(*a->map, *b->map);

    default:
      std::terminate();
  }
}
