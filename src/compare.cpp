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
#include "recset/set.hpp"
#include "recset/map.hpp"

#include <algorithm>


template <typename T>
static int
_sign(const T &a, const T &b)
{ return a < b ? -1 : b < a ? 1 : 0; }


static int
_rank(rcs::tag t) noexcept
{
  switch (t)
  {
    case rcs::tag::num: return 0;
    case rcs::tag::str: return 1;
    default: return 2;
  }
}


static int
_compare_arrays(const rcs::value *a, size_t na, const rcs::value *b, size_t nb)
{
  if (na != nb)
    return _sign(na, nb);
  for (size_t i = 0; i < na; ++i)
  {
    if (const int c = rcs::compare(a[i], b[i]); c != 0)
      return c;
  }
  return 0;
}


static int
_compare_sets(rcs::value a, rcs::value b)
{
  const rcs::stl::vector<rcs::value> ae = as_set(a).sorted();
  const rcs::stl::vector<rcs::value> be = as_set(b).sorted();
  return _compare_arrays(ae.data(), ae.size(), be.data(), be.size());
}


static int
_compare_maps(rcs::value a, rcs::value b)
{
  const auto ae = as_map(a).entries();
  const auto be = as_map(b).entries();
  if (ae.size() != be.size())
    return _sign(ae.size(), be.size());
  for (size_t i = 0; i < ae.size(); ++i)
  {
    if (const int c = rcs::compare(ae[i].first, be[i].first); c != 0)
      return c;
    if (const int c = rcs::compare(ae[i].second, be[i].second); c != 0)
      return c;
  }
  return 0;
}


int
rcs::compare(value a, value b)
{
  if (is(a, b))
    return 0;

  if (const int ra = _rank(a->t), rb = _rank(b->t); ra != rb)
    return _sign(ra, rb);

  switch (a->t)
  {
    case tag::num:
      return _sign(a->num, b->num);

    case tag::str:
    {
      const int c = str_view(a).compare(str_view(b));
      return c < 0 ? -1 : c > 0 ? 1 : 0;
    }

    default:
      break;
  }

  if (const uint32_t ha = hash(a), hb = hash(b); ha != hb)
    return _sign(ha, hb);

  // Hash collision across kinds
  if (a->t != b->t)
    return _sign(static_cast<int>(a->t), static_cast<int>(b->t));

  RECSET_FUNCTION_BENCHMARK

  switch (a->t)
  {
    case tag::seq:
    {
      const auto &ae = a->seq->elements, &be = b->seq->elements;
      return _compare_arrays(ae.data(), ae.size(), be.data(), be.size());
    }

    case tag::tuple:
      return _compare_arrays(a->tup.data, a->tup.len, b->tup.data, b->tup.len);

    case tag::set:
      return _compare_sets(a, b);

    case tag::map:
      return _compare_maps(a, b);

    default:
      std::terminate();
  }
}
