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
#include "recset/detail/bodies.hpp"
#include "recset/detail/cursor.hpp"
#include "recset/stl/vector.hpp"

#include <initializer_list>
#include <optional>
#include <ranges>
#include <string>
#include <utility>

/**
 * \file map.hpp
 * Associative container with structural keys
 *
 * \ingroup containers
 */


namespace rcs {

/**
 * Mapping from values to values
 *
 * Shares the storage scheme of rcs::set, with a parallel array of values.
 * Keys are frozen on insertion; values stay as they are until the hash of
 * the map is computed, which freezes all of them.
 *
 * \ingroup containers
 */
class map: public value {
  public:
  using entry = std::pair<value, value>;

  /**
   * Construct an empty map
   */
  map();

  /**
   * Construct a map of the given entries (later entries override earlier
   * ones with an equal key)
   */
  map(std::initializer_list<entry> entries);

  template <std::ranges::input_range R>
  [[nodiscard]] static map
  from(R &&range)
  {
    map ret;
    for (auto &&[k, v] : range)
      ret.set(k, v);
    return ret;
  }

  /**
   * Bind \p k to \p v, replacing the previous value if any
   *
   * \return This map
   * \throws frozen_mutation_error
   * \throws invalid_value_error If the key or the value is non-finite
   * \throws cycle_violation_error If the key or the value contains this map
   */
  map&
  set(value k, value v);

  /**
   * Remove the entry with key \p k
   *
   * \return Whether an entry was removed
   * \throws frozen_mutation_error
   */
  bool
  erase(value k);

  void
  clear();

  void
  reserve(size_t n);

  /**
   * Value bound to \p k
   *
   * \return The value, or nullopt if there is no such key
   */
  std::optional<value>
  get(value k) const;

  /**
   * \throws std::out_of_range If there is no such key
   */
  value
  at(value k) const;

  bool
  has(value k) const
  { return get(k).has_value(); }

  size_t
  size() const noexcept
  { return body().keys.size(); }

  bool
  empty() const noexcept
  { return size() == 0; }

  bool
  equals(value other) const
  { return equal(*this, other); }

  int
  compare(value other) const
  { return rcs::compare(*this, other); }

  bool
  is_frozen() const noexcept
  { return (*this)->frozen; }

  /**
   * \name Canonical views
   * Ordered by key (see rcs::compare())
   * \{
   */
  [[nodiscard]] stl::vector<value>
  keys() const;

  [[nodiscard]] stl::vector<value>
  values() const;

  [[nodiscard]] stl::vector<entry>
  entries() const;
  /** \} */

  /**
   * Iterate over a snapshot of the entries in storage order
   */
  detail::entry_cursor
  begin() const;

  std::default_sentinel_t
  end() const noexcept
  { return std::default_sentinel; }

  /**
   * Content hash
   *
   * \warning Freezes the map with all its values.
   */
  uint32_t
  hash_code() const
  { return hash(*this); }

  void
  freeze() const
  { rcs::freeze(*this); }

  [[nodiscard]] map
  mutable_copy() const;

  [[nodiscard]] map
  clone() const
  { return mutable_copy(); }

  std::string
  to_string() const
  { return rcs::to_string(*this); }

  private:
  explicit map(object *ptr): value {ptr} { }

  detail::map_body&
  body() const noexcept
  { return *(*this)->map; }

  friend map as_map(value x);
}; // class rcs::map


/**
 * Checked conversion of a value to a map handle
 *
 * \throws std::invalid_argument If \p x is not a map
 *
 * \ingroup containers
 */
[[nodiscard]] map
as_map(value x);

} // namespace rcs
