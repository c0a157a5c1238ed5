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


#include "recset/set.hpp"
#include "recset/tuple.hpp"
#include "recset/exceptions.hpp"
#include "recset/foundation.hpp"
#include "recset/logging.hpp"
#include "recset/utilities/execution_timer.hpp"

#include <algorithm>


size_t rcs::powerset_limit = 20;

// Widest subset mask
static constexpr size_t _max_powerset_size = 63;


rcs::detail::probe_result
rcs::detail::set_body::find(value x, uint32_t h) const
{
  return index.find(h, [&](size_t i) {
    return hashes[i] == h and equal(elements[i], x);
  });
}


static rcs::object*
_make_set()
{
  rcs::object *obj = rcs::make<rcs::object>(rcs::tag::set);
  obj->set = rcs::make<rcs::detail::set_body>();
  return obj;
}


rcs::set::set()
: value {_make_set()}
{ }


rcs::set::set(std::initializer_list<value> elements)
: set()
{
  reserve(elements.size());
  for (const value &x : elements)
    add(x);
}


rcs::set&
rcs::set::add(value x)
{
  require_mutable(*this, "add");
  require_storable(x, "add");
  require_well_founded(x, *this, "add");

  detail::set_body &b = body();
  const uint32_t h = hash(x);
  detail::probe_result r = b.find(x, h);
  if (r.found())
    return *this;

  if (b.index.must_grow(b.elements.size()))
  {
    b.index.rebuild(b.index.bucket_count() * 2, b.hashes);
    r = b.find(x, h);
  }

  b.index.occupy(r.slot, b.elements.size());
  b.elements.push_back(x);
  b.hashes.push_back(h);
  b.xor_hash ^= h;
  return *this;
}


bool
rcs::set::remove(value x)
{
  require_mutable(*this, "remove");
  if (not is_storable(x))
    return false;

  detail::set_body &b = body();
  const uint32_t h = hash(x);
  const detail::probe_result r = b.find(x, h);
  if (not r.found())
    return false;

  b.index.vacate(r.slot, b.hashes);

  // Swap-and-pop
  const size_t last = b.elements.size() - 1;
  if (r.index != last)
  {
    b.elements[r.index] = b.elements[last];
    b.hashes[r.index] = b.hashes[last];
    b.index.retarget(b.hashes[r.index], last, r.index);
  }
  b.elements.pop_back();
  b.hashes.pop_back();
  b.xor_hash ^= h;
  return true;
}


void
rcs::set::clear()
{
  require_mutable(*this, "clear");
  detail::set_body &b = body();
  b.elements.clear();
  b.hashes.clear();
  b.index.reset();
  b.xor_hash = 0;
}


void
rcs::set::reserve(size_t n)
{
  require_mutable(*this, "reserve");
  detail::set_body &b = body();
  const size_t buckets = detail::probe_table::buckets_for(n);
  if (buckets > b.index.bucket_count())
    b.index.rebuild(buckets, b.hashes);
  b.elements.reserve(n);
  b.hashes.reserve(n);
}


bool
rcs::set::has(value x) const
{
  if (not is_storable(x))
    return false;
  return body().find(x, hash(x)).found();
}


rcs::stl::vector<rcs::value>
rcs::set::sorted() const
{
  stl::vector<value> ret(body().elements);
  std::ranges::sort(ret, less {});
  return ret;
}


std::optional<rcs::value>
rcs::set::pick_random() const
{
  static std::mt19937 generator {std::random_device {}()};
  return pick_random(generator);
}


rcs::set
rcs::set::unite(const set &other) const
{
  set ret = mutable_copy();
  ret.reserve(size() + other.size());
  for (const value &x : other.body().elements)
    ret.add(x);
  return ret;
}


rcs::set
rcs::set::intersection(const set &other) const
{
  const set &small = size() <= other.size() ? *this : other;
  const set &large = size() <= other.size() ? other : *this;
  set ret;
  for (const value &x : small.body().elements)
  {
    if (large.has(x))
      ret.add(x);
  }
  return ret;
}


rcs::set
rcs::set::difference(const set &other) const
{
  set ret;
  for (const value &x : body().elements)
  {
    if (not other.has(x))
      ret.add(x);
  }
  return ret;
}


rcs::set
rcs::set::symmetric_difference(const set &other) const
{
  set ret = difference(other);
  for (const value &x : other.body().elements)
  {
    if (not has(x))
      ret.add(x);
  }
  return ret;
}


rcs::set
rcs::set::cartesian_product(const set &other) const
{
  RECSET_FUNCTION_BENCHMARK

  set ret;
  ret.reserve(size() * other.size());
  for (const value &a : body().elements)
  {
    for (const value &b : other.body().elements)
      ret.add(tuple {a, b});
  }
  debug("cartesian product of {} and {} elements", size(), other.size());
  return ret;
}


rcs::set
rcs::set::powerset(size_t limit) const
{
  RECSET_FUNCTION_BENCHMARK

  const size_t n = size();
  const size_t bound = std::min(limit, _max_powerset_size);
  if (n > bound)
    throw capacity_exceeded_error {"powerset", n, bound};

  const stl::vector<value> elements = sorted();
  const uint64_t nsubsets = uint64_t(1) << n;
  set ret;
  ret.reserve(nsubsets);
  for (uint64_t mask = 0; mask < nsubsets; ++mask)
  {
    set subset;
    for (size_t i = 0; i < n; ++i)
    {
      if (mask & (uint64_t(1) << i))
        subset.add(elements[i]);
    }
    ret.add(subset);
  }
  debug("powerset of {} elements: {} subsets", n, nsubsets);
  return ret;
}


bool
rcs::set::is_subset(const set &other) const
{
  if (size() > other.size())
    return false;
  return std::ranges::all_of(body().elements,
                             [&](const value &x) { return other.has(x); });
}


rcs::detail::value_cursor
rcs::set::begin() const
{
  const auto &elements = body().elements;
  return {detail::snapshot(elements.data(), elements.size(), is_frozen()),
          elements.size()};
}


rcs::set
rcs::set::mutable_copy() const
{
  set ret;
  detail::set_body &b = ret.body();
  b.elements = body().elements;
  b.hashes = body().hashes;
  b.index = body().index;
  b.xor_hash = body().xor_hash;
  return ret;
}


rcs::set
rcs::as_set(value x)
{
  if (not isset(x))
    throw std::invalid_argument {"as_set() - not a set"};
  return set(&*x);
}
