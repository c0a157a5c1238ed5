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

#include <initializer_list>
#include <ranges>
#include <string>

/**
 * \file sequence.hpp
 * Growable ordered container
 *
 * \ingroup containers
 */


namespace rcs {

/**
 * Ordered list of values
 *
 * Mutable until its hash is read. Nested containers stay mutable while the
 * sequence is and are frozen together with it.
 *
 * \ingroup containers
 */
class sequence: public value {
  public:
  /**
   * Construct an empty sequence
   */
  sequence();

  /**
   * Construct a sequence of the given elements
   *
   * \throws invalid_value_error If an element is a non-finite number
   */
  sequence(std::initializer_list<value> elements);

  template <std::ranges::input_range R>
  [[nodiscard]] static sequence
  from(R &&range)
  {
    sequence ret;
    for (auto &&x : range)
      ret.push_back(x);
    return ret;
  }

  /**
   * Append an element
   *
   * \throws frozen_mutation_error
   * \throws invalid_value_error
   * \throws cycle_violation_error If \p x contains this sequence
   */
  sequence&
  push_back(value x);

  /**
   * Remove the last element
   *
   * \return The removed element
   * \throws frozen_mutation_error
   * \throws std::out_of_range If the sequence is empty
   */
  value
  pop_back();

  /**
   * Replace the element at position \p i
   *
   * \throws std::out_of_range If \p i is not less than size()
   */
  sequence&
  assign(size_t i, value x);

  void
  clear();

  /**
   * \throws std::out_of_range If \p i is not less than size()
   */
  const value&
  at(size_t i) const;

  size_t
  size() const noexcept
  { return body().elements.size(); }

  bool
  empty() const noexcept
  { return size() == 0; }

  /**
   * Iterate over a snapshot of the elements
   */
  detail::value_cursor
  begin() const;

  std::default_sentinel_t
  end() const noexcept
  { return std::default_sentinel; }

  /**
   * Content hash
   *
   * \warning Freezes the sequence and all containers inside it.
   */
  uint32_t
  hash_code() const
  { return hash(*this); }

  void
  freeze() const
  { rcs::freeze(*this); }

  bool
  is_frozen() const noexcept
  { return (*this)->frozen; }

  bool
  equals(value other) const
  { return equal(*this, other); }

  int
  compare(value other) const
  { return rcs::compare(*this, other); }

  /**
   * Independent mutable sequence with the same elements
   */
  [[nodiscard]] sequence
  mutable_copy() const;

  [[nodiscard]] sequence
  clone() const
  { return mutable_copy(); }

  std::string
  to_string() const
  { return rcs::to_string(*this); }

  private:
  explicit sequence(object *ptr): value {ptr} { }

  detail::sequence_body&
  body() const noexcept
  { return *(*this)->seq; }

  friend sequence as_seq(value x);
}; // class rcs::sequence


/**
 * Checked conversion of a value to a sequence handle
 *
 * \throws std::invalid_argument If \p x is not a sequence
 *
 * \ingroup containers
 */
[[nodiscard]] sequence
as_seq(value x);

} // namespace rcs
