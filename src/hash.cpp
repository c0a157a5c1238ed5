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
#include "recset/hash.hpp"
#include "recset/detail/bodies.hpp"

#include <bit>
#include <cmath>
#include <limits>


uint32_t
rcs::hash_number(double x) noexcept
{
  // -0.0 takes this path too and lands on the hash of 0
  if (std::trunc(x) == x and x >= std::numeric_limits<int32_t>::min() and
      x <= std::numeric_limits<int32_t>::max())
  {
    uint32_t h = static_cast<uint32_t>(static_cast<int32_t>(x));
    h = ((h >> 16) ^ h) * 0x45d9f3bu;
    h = ((h >> 16) ^ h) * 0x45d9f3bu;
    h = (h >> 16) ^ h;
    return h;
  }

  const uint64_t bits = std::bit_cast<uint64_t>(x);
  const uint32_t lo = static_cast<uint32_t>(bits);
  const uint32_t hi = static_cast<uint32_t>(bits >> 32);
  uint32_t h = 2166136261u;
  h ^= lo;
  h *= 16777619u;
  h ^= hi;
  h *= 16777619u;
  return h;
}


uint32_t
rcs::hash_string(std::string_view s) noexcept
{
  uint32_t h = 2166136261u;
  for (const char c : s)
  {
    h ^= static_cast<unsigned char>(c);
    h *= 16777619u;
  }
  return h;
}


static uint32_t
_sequence_hash(const rcs::value *data, size_t len)
{
  uint32_t h = 0;
  for (size_t i = 0; i < len; ++i)
    h = 31 * h + rcs::hash(data[i]);
  return h;
}

static uint32_t
_map_hash(const rcs::detail::map_body &body)
{
  uint32_t h = 0;
  for (size_t i = 0; i < body.keys.size(); ++i)
    h ^= (31 * body.hashes[i]) ^ rcs::hash(body.values[i]);
  return h;
}


uint32_t
rcs::hash(value x)
{
  if (x->frozen)
    return x->hash;

  // Primitives and tuples are born frozen
  switch (x->t)
  {
    case tag::seq:
    {
      const auto &elements = x->seq->elements;
      x->hash = _sequence_hash(elements.data(), elements.size());
      break;
    }

    case tag::set:
      // Elements are frozen on insertion and the XOR is kept up to date
      x->hash = x->set->xor_hash;
      break;

    case tag::map:
      x->hash = _map_hash(*x->map);
      break;

    default:
      std::terminate();
  }

  x->frozen = true;
  return x->hash;
}


void
rcs::freeze(value x)
{ static_cast<void>(hash(x)); }


uint32_t
rcs::detail::tuple_hash(const value *data, size_t len)
{
  uint32_t h = 1;
  for (size_t i = 0; i < len; ++i)
    h = 31 * h + hash(data[i]);
  return h;
}
