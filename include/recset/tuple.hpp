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
#include "recset/stl/vector.hpp"

#include <initializer_list>
#include <ranges>
#include <string>

/**
 * \file tuple.hpp
 * Fixed-length ordered container
 *
 * \ingroup containers
 */


namespace rcs {

/**
 * Immutable fixed-length sequence of values
 *
 * A tuple is frozen from construction: its elements are copied into private
 * storage and hashed (which freezes nested containers) right away. Element
 * order is significant.
 *
 * \ingroup containers
 */
class tuple: public value {
  public:
  using iterator = const value*;

  /**
   * Construct the empty tuple
   */
  tuple();

  /**
   * Construct a tuple of the given elements
   *
   * \throws invalid_value_error If an element is a non-finite number
   */
  tuple(std::initializer_list<value> elements);

  /**
   * Construct a tuple of the elements of a range
   */
  template <std::ranges::input_range R>
  [[nodiscard]] static tuple
  from(R &&range)
  {
    stl::vector<value> buf;
    for (auto &&x : range)
      buf.emplace_back(x);
    return tuple(buf.data(), buf.size());
  }

  size_t
  size() const noexcept
  { return (*this)->tup.len; }

  bool
  empty() const noexcept
  { return size() == 0; }

  /**
   * Element access without bounds checking
   */
  const value&
  operator [] (size_t i) const noexcept
  { return (*this)->tup.data[i]; }

  /**
   * Element access
   *
   * \throws std::out_of_range If \p i is not less than size()
   */
  const value&
  at(size_t i) const;

  iterator
  begin() const noexcept
  { return (*this)->tup.data; }

  iterator
  end() const noexcept
  { return (*this)->tup.data + size(); }

  uint32_t
  hash_code() const noexcept
  { return (*this)->hash; }

  bool
  equals(value other) const
  { return equal(*this, other); }

  int
  compare(value other) const
  { return rcs::compare(*this, other); }

  std::string
  to_string() const
  { return rcs::to_string(*this); }

  private:
  explicit tuple(object *ptr): value {ptr} { }

  tuple(const value *data, size_t len);

  friend tuple as_tuple(value x);
}; // class rcs::tuple


/**
 * Checked conversion of a value to a tuple handle
 *
 * \throws std::invalid_argument If \p x is not a tuple
 *
 * \ingroup containers
 */
[[nodiscard]] tuple
as_tuple(value x);

} // namespace rcs
