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


#include "recset/detail/probe_table.hpp"
#include "recset/logging.hpp"


rcs::detail::probe_table::probe_table()
: m_slots(min_buckets, 0), m_mask {min_buckets - 1}
{ }


size_t
rcs::detail::probe_table::buckets_for(size_t count) noexcept
{
  size_t buckets = min_buckets;
  while (count * 4 > buckets * 3)
    buckets <<= 1;
  return buckets;
}


void
rcs::detail::probe_table::vacate(size_t hole, const hash_array &hashes) noexcept
{
  const size_t nbuckets = bucket_count();
  size_t i = (hole + 1) & m_mask;
  while (m_slots[i] != 0)
  {
    const uint32_t entry = m_slots[i];
    const size_t ideal = hashes[entry - 1] & m_mask;

    // Move the entry into the hole unless the hole lies before its ideal
    // bucket (moving it would make it unreachable)
    const size_t holedist = (hole + nbuckets - ideal) & m_mask;
    const size_t idist = (i + nbuckets - ideal) & m_mask;
    if (holedist < idist)
    {
      m_slots[hole] = entry;
      hole = i;
    }
    i = (i + 1) & m_mask;
  }
  m_slots[hole] = 0;
}


void
rcs::detail::probe_table::retarget(uint32_t hash, size_t from,
                                   size_t to) noexcept
{
  size_t slot = hash & m_mask;
  while (m_slots[slot] != from + 1)
    slot = (slot + 1) & m_mask;
  m_slots[slot] = uint32_t(to + 1);
}


void
rcs::detail::probe_table::rebuild(size_t buckets, const hash_array &hashes)
{
  debug("rebuilding probe table: {} -> {} buckets ({} entries)",
        bucket_count(), buckets, hashes.size());

  m_slots.assign(buckets, 0);
  m_mask = buckets - 1;
  for (size_t i = 0; i < hashes.size(); ++i)
  {
    size_t slot = hashes[i] & m_mask;
    while (m_slots[slot] != 0)
      slot = (slot + 1) & m_mask;
    m_slots[slot] = uint32_t(i + 1);
  }
}


void
rcs::detail::probe_table::reset()
{
  m_slots.assign(min_buckets, 0);
  m_mask = min_buckets - 1;
}
