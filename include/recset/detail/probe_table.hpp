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

#include "recset/stl/vector.hpp"

#include <cstdint>
#include <cstddef>
#include <limits>

/**
 * \file probe_table.hpp
 * Sparse index of the open-addressing containers
 *
 * Layout (shared by set and map):
 *
 *   dense arrays : elements (or keys and values) and their hashes, no holes
 *   slots        : power-of-two array; slot = dense index + 1, 0 = empty
 *
 * Collisions are resolved by linear probing. Removal shifts the rest of the
 * probe chain backward instead of leaving tombstones, so lookups never pay
 * for past deletions.
 *
 * \ingroup containers
 */


namespace rcs::detail {

using hash_array = stl::atomic_vector<uint32_t>;


/**
 * Outcome of a probe sequence
 */
struct probe_result {
  static constexpr size_t npos = std::numeric_limits<size_t>::max();

  size_t slot;  /**< Matching slot, or the empty slot ending the chain */
  size_t index; /**< Dense index of the match, or npos */

  bool
  found() const noexcept
  { return index != npos; }
}; // struct rcs::detail::probe_result


class probe_table {
  public:
  static constexpr size_t min_buckets = 16;

  probe_table();

  /**
   * Smallest admissible bucket count holding \p count entries within the
   * 0.75 load factor
   */
  [[nodiscard]] static size_t
  buckets_for(size_t count) noexcept;

  size_t
  bucket_count() const noexcept
  { return m_slots.size(); }

  /**
   * Check whether inserting one more entry would exceed the load factor
   */
  bool
  must_grow(size_t count) const noexcept
  { return (count + 1) * 4 > bucket_count() * 3; }

  /**
   * Walk the probe chain of \p hash
   *
   * \param hash Hash of the searched entry
   * \param match Predicate on dense indices of entries with candidate slots
   */
  template <typename Match>
  probe_result
  find(uint32_t hash, Match &&match) const
  {
    size_t slot = hash & m_mask;
    while (true)
    {
      const uint32_t entry = m_slots[slot];
      if (entry == 0)
        return {slot, probe_result::npos};
      if (match(size_t(entry - 1)))
        return {slot, size_t(entry - 1)};
      slot = (slot + 1) & m_mask;
    }
  }

  /**
   * Point an empty slot (as returned by find()) to a dense index
   */
  void
  occupy(size_t slot, size_t index) noexcept
  { m_slots[slot] = uint32_t(index + 1); }

  /**
   * Empty a slot and repair the probe chain behind it
   *
   * \param slot Slot to empty
   * \param hashes Hashes of the dense entries
   */
  void
  vacate(size_t slot, const hash_array &hashes) noexcept;

  /**
   * Update the slot of the entry with hash \p hash after it moved from dense
   * index \p from to \p to
   */
  void
  retarget(uint32_t hash, size_t from, size_t to) noexcept;

  /**
   * Reallocate the slots with \p buckets buckets and reinsert all entries
   */
  void
  rebuild(size_t buckets, const hash_array &hashes);

  /**
   * Reset to an empty table of minimal size
   */
  void
  reset();

  private:
  stl::atomic_vector<uint32_t> m_slots;
  size_t m_mask;
}; // class rcs::detail::probe_table

} // namespace rcs::detail
