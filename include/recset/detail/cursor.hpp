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

#include <cstddef>
#include <iterator>
#include <utility>

/**
 * \file cursor.hpp
 * Iterators over container snapshots
 *
 * Iteration over a mutable container walks a copy of its dense storage taken
 * when the iteration begins. Mutations performed while iterating are not
 * observed. Frozen containers hand out their storage directly.
 *
 * Cursors are terminated by `std::default_sentinel`.
 *
 * \ingroup containers
 */


namespace rcs::detail {

/**
 * Copy \p n handles into a fresh collected array unless \p frozen
 */
[[nodiscard]] inline const value*
snapshot(const value *data, size_t n, bool frozen)
{ return frozen ? data : copy_array(data, n); }


/**
 * Forward cursor over an array of values
 */
class value_cursor {
  public:
  using value_type = value;
  using difference_type = std::ptrdiff_t;

  value_cursor() = default;

  value_cursor(const value *data, size_t len)
  : m_data {data}, m_len {len}, m_pos {0}
  { }

  const value&
  operator * () const noexcept
  { return m_data[m_pos]; }

  const value*
  operator -> () const noexcept
  { return m_data + m_pos; }

  value_cursor&
  operator ++ () noexcept
  { ++m_pos; return *this; }

  value_cursor
  operator ++ (int) noexcept
  { value_cursor tmp = *this; ++m_pos; return tmp; }

  bool
  operator == (std::default_sentinel_t) const noexcept
  { return m_pos == m_len; }

  bool
  operator == (const value_cursor &other) const noexcept
  { return m_data + m_pos == other.m_data + other.m_pos; }

  private:
  const value *m_data = nullptr;
  size_t m_len = 0;
  size_t m_pos = 0;
}; // class rcs::detail::value_cursor


/**
 * Forward cursor over parallel arrays of keys and values yielding pairs
 */
class entry_cursor {
  public:
  using value_type = std::pair<value, value>;
  using difference_type = std::ptrdiff_t;

  entry_cursor() = default;

  entry_cursor(const value *keys, const value *values, size_t len)
  : m_keys {keys}, m_values {values}, m_len {len}, m_pos {0}
  { }

  value_type
  operator * () const
  { return {m_keys[m_pos], m_values[m_pos]}; }

  entry_cursor&
  operator ++ () noexcept
  { ++m_pos; return *this; }

  entry_cursor
  operator ++ (int) noexcept
  { entry_cursor tmp = *this; ++m_pos; return tmp; }

  bool
  operator == (std::default_sentinel_t) const noexcept
  { return m_pos == m_len; }

  bool
  operator == (const entry_cursor &other) const noexcept
  { return m_keys + m_pos == other.m_keys + other.m_pos; }

  private:
  const value *m_keys = nullptr;
  const value *m_values = nullptr;
  size_t m_len = 0;
  size_t m_pos = 0;
}; // class rcs::detail::entry_cursor

} // namespace rcs::detail
