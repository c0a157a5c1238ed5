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

#include "recset/value.hpp"
#include "recset/detail/probe_table.hpp"
#include "recset/stl/vector.hpp"

/**
 * \file bodies.hpp
 * Storage of the variable-size containers
 *
 * \ingroup containers
 */


namespace rcs::detail {

/**
 * Ordered hash of tuple elements (freezes them)
 */
[[nodiscard]] uint32_t
tuple_hash(const value *data, size_t len);


struct sequence_body {
  stl::vector<value> elements;
}; // struct rcs::detail::sequence_body


struct set_body {
  /**
   * Find the dense index of an element
   *
   * \param x Element (frozen)
   * \param h Hash of \p x
   */
  [[nodiscard]] probe_result
  find(value x, uint32_t h) const;

  stl::vector<value> elements;
  hash_array hashes;
  probe_table index;
  uint32_t xor_hash = 0; /**< XOR of all element hashes */
}; // struct rcs::detail::set_body


struct map_body {
  /**
   * Find the dense index of a key
   *
   * \param k Key (frozen)
   * \param h Hash of \p k
   */
  [[nodiscard]] probe_result
  find(value k, uint32_t h) const;

  stl::vector<value> keys;
  stl::vector<value> values;
  hash_array hashes; /**< Hashes of the keys */
  probe_table index;
}; // struct rcs::detail::map_body

} // namespace rcs::detail
