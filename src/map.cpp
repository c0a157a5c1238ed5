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


#include "recset/map.hpp"
#include "recset/exceptions.hpp"
#include "recset/foundation.hpp"

#include <algorithm>
#include <format>
#include <numeric>


rcs::detail::probe_result
rcs::detail::map_body::find(value k, uint32_t h) const
{
  return index.find(h, [&](size_t i) {
    return hashes[i] == h and equal(keys[i], k);
  });
}


static rcs::object*
_make_map()
{
  rcs::object *obj = rcs::make<rcs::object>(rcs::tag::map);
  obj->map = rcs::make<rcs::detail::map_body>();
  return obj;
}


rcs::map::map()
: value {_make_map()}
{ }


rcs::map::map(std::initializer_list<entry> entries)
: map()
{
  reserve(entries.size());
  for (const auto &[k, v] : entries)
    set(k, v);
}


rcs::map&
rcs::map::set(value k, value v)
{
  require_mutable(*this, "set");
  require_storable(k, "set");
  require_storable(v, "set");
  require_well_founded(k, *this, "set");
  require_well_founded(v, *this, "set");

  detail::map_body &b = body();
  const uint32_t h = hash(k);
  detail::probe_result r = b.find(k, h);
  if (r.found())
  {
    b.values[r.index] = v;
    return *this;
  }

  if (b.index.must_grow(b.keys.size()))
  {
    b.index.rebuild(b.index.bucket_count() * 2, b.hashes);
    r = b.find(k, h);
  }

  b.index.occupy(r.slot, b.keys.size());
  b.keys.push_back(k);
  b.values.push_back(v);
  b.hashes.push_back(h);
  return *this;
}


bool
rcs::map::erase(value k)
{
  require_mutable(*this, "erase");
  if (not is_storable(k))
    return false;

  detail::map_body &b = body();
  const detail::probe_result r = b.find(k, hash(k));
  if (not r.found())
    return false;

  b.index.vacate(r.slot, b.hashes);

  const size_t last = b.keys.size() - 1;
  if (r.index != last)
  {
    b.keys[r.index] = b.keys[last];
    b.values[r.index] = b.values[last];
    b.hashes[r.index] = b.hashes[last];
    b.index.retarget(b.hashes[r.index], last, r.index);
  }
  b.keys.pop_back();
  b.values.pop_back();
  b.hashes.pop_back();
  return true;
}


void
rcs::map::clear()
{
  require_mutable(*this, "clear");
  detail::map_body &b = body();
  b.keys.clear();
  b.values.clear();
  b.hashes.clear();
  b.index.reset();
}


void
rcs::map::reserve(size_t n)
{
  require_mutable(*this, "reserve");
  detail::map_body &b = body();
  const size_t buckets = detail::probe_table::buckets_for(n);
  if (buckets > b.index.bucket_count())
    b.index.rebuild(buckets, b.hashes);
  b.keys.reserve(n);
  b.values.reserve(n);
  b.hashes.reserve(n);
}


std::optional<rcs::value>
rcs::map::get(value k) const
{
  if (not is_storable(k))
    return std::nullopt;
  const detail::probe_result r = body().find(k, hash(k));
  if (not r.found())
    return std::nullopt;
  return body().values[r.index];
}


rcs::value
rcs::map::at(value k) const
{
  if (const std::optional<value> v = get(k))
    return *v;
  throw std::out_of_range {
      std::format("map::at() - no key {}", rcs::to_string(k))};
}


// Dense indices in canonical key order
static rcs::stl::atomic_vector<size_t>
_key_order(const rcs::detail::map_body &b)
{
  rcs::stl::atomic_vector<size_t> order(b.keys.size());
  std::iota(order.begin(), order.end(), size_t(0));
  std::ranges::sort(order, [&](size_t i, size_t j) {
    return rcs::compare(b.keys[i], b.keys[j]) < 0;
  });
  return order;
}


rcs::stl::vector<rcs::value>
rcs::map::keys() const
{
  stl::vector<value> ret;
  ret.reserve(size());
  for (const size_t i : _key_order(body()))
    ret.push_back(body().keys[i]);
  return ret;
}


rcs::stl::vector<rcs::value>
rcs::map::values() const
{
  stl::vector<value> ret;
  ret.reserve(size());
  for (const size_t i : _key_order(body()))
    ret.push_back(body().values[i]);
  return ret;
}


rcs::stl::vector<rcs::map::entry>
rcs::map::entries() const
{
  stl::vector<entry> ret;
  ret.reserve(size());
  for (const size_t i : _key_order(body()))
    ret.emplace_back(body().keys[i], body().values[i]);
  return ret;
}


rcs::detail::entry_cursor
rcs::map::begin() const
{
  const detail::map_body &b = body();
  return {detail::snapshot(b.keys.data(), b.keys.size(), is_frozen()),
          detail::snapshot(b.values.data(), b.values.size(), is_frozen()),
          b.keys.size()};
}


rcs::map
rcs::map::mutable_copy() const
{
  map ret;
  detail::map_body &b = ret.body();
  b.keys = body().keys;
  b.values = body().values;
  b.hashes = body().hashes;
  b.index = body().index;
  return ret;
}


rcs::map
rcs::as_map(value x)
{
  if (not ismap(x))
    throw std::invalid_argument {"as_map() - not a map"};
  return map(&*x);
}
