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
#include <random>
#include <ranges>
#include <string>

/**
 * \file set.hpp
 * Unordered collection of unique values
 *
 * \ingroup containers
 */


namespace rcs {

/**
 * Default bound on the size of a set accepted by set::powerset()
 *
 * \ingroup containers
 */
extern size_t powerset_limit;


/**
 * Set of values with structural equality
 *
 * Elements live in a dense array indexed by an open-addressing hash table
 * (see detail::probe_table). Every inserted element is frozen. The hash of
 * the set is the XOR of its element hashes, kept up to date on each
 * modification, so reading it is free; reading it does however freeze the
 * set for good.
 *
 * Algebra operations never modify their operands and return new mutable
 * sets.
 *
 * \ingroup containers
 */
class set: public value {
  public:
  /**
   * Construct an empty set
   */
  set();

  /**
   * Construct a set of the given elements (duplicates collapse)
   *
   * \throws invalid_value_error If an element is a non-finite number
   */
  set(std::initializer_list<value> elements);

  template <std::ranges::input_range R>
  [[nodiscard]] static set
  from(R &&range)
  {
    set ret;
    for (auto &&x : range)
      ret.add(x);
    return ret;
  }

  /**
   * \name Mutation
   * \{
   */

  /**
   * Insert an element (no-op if an equal element is present)
   *
   * \param x Element to insert; it gets frozen
   * \return This set
   * \throws frozen_mutation_error
   * \throws invalid_value_error If \p x is a non-finite number
   * \throws cycle_violation_error If \p x contains this set
   */
  set&
  add(value x);

  /**
   * Remove an element
   *
   * \return Whether an element was removed
   * \throws frozen_mutation_error
   */
  bool
  remove(value x);

  void
  clear();

  /**
   * Grow the storage to hold \p n elements without rehashing
   */
  void
  reserve(size_t n);

  /** \} */

  /**
   * \name Queries
   * \{
   */

  /**
   * Membership test
   *
   * \note A container passed as \p x is frozen by the lookup.
   */
  bool
  has(value x) const;

  size_t
  size() const noexcept
  { return body().elements.size(); }

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
   * Elements in canonical order (see rcs::compare())
   */
  [[nodiscard]] stl::vector<value>
  sorted() const;

  /**
   * Uniformly chosen element
   *
   * \return The element or nullopt for the empty set
   */
  template <typename URBG>
    requires std::uniform_random_bit_generator<std::remove_reference_t<URBG>>
  std::optional<value>
  pick_random(URBG &&urbg) const
  {
    if (empty())
      return std::nullopt;
    std::uniform_int_distribution<size_t> dist {0, size() - 1};
    return body().elements[dist(urbg)];
  }

  std::optional<value>
  pick_random() const;

  /** \} */

  /**
   * \name Algebra
   * \{
   */

  [[nodiscard]] set
  unite(const set &other) const;

  [[nodiscard]] set
  intersection(const set &other) const;

  [[nodiscard]] set
  difference(const set &other) const;

  [[nodiscard]] set
  symmetric_difference(const set &other) const;

  /**
   * Set of all pairs `(a, b)` with `a` from this set and `b` from \p other
   */
  [[nodiscard]] set
  cartesian_product(const set &other) const;

  /**
   * Set of all subsets
   *
   * \param limit Largest admissible size of this set
   * \throws capacity_exceeded_error If size() exceeds \p limit (or 63)
   */
  [[nodiscard]] set
  powerset(size_t limit) const;

  [[nodiscard]] set
  powerset() const
  { return powerset(powerset_limit); }

  bool
  is_subset(const set &other) const;

  bool
  is_superset(const set &other) const
  { return other.is_subset(*this); }

  /** \} */

  /**
   * Iterate over a snapshot of the elements in storage order
   */
  detail::value_cursor
  begin() const;

  std::default_sentinel_t
  end() const noexcept
  { return std::default_sentinel; }

  /**
   * Content hash
   *
   * \warning Freezes the set.
   */
  uint32_t
  hash_code() const
  { return hash(*this); }

  void
  freeze() const
  { rcs::freeze(*this); }

  /**
   * Independent mutable set with the same elements
   */
  [[nodiscard]] set
  mutable_copy() const;

  [[nodiscard]] set
  clone() const
  { return mutable_copy(); }

  std::string
  to_string() const
  { return rcs::to_string(*this); }

  private:
  explicit set(object *ptr): value {ptr} { }

  detail::set_body&
  body() const noexcept
  { return *(*this)->set; }

  friend set as_set(value x);
}; // class rcs::set


/**
 * Checked conversion of a value to a set handle
 *
 * \throws std::invalid_argument If \p x is not a set
 *
 * \ingroup containers
 */
[[nodiscard]] set
as_set(value x);

[[nodiscard]] inline set
empty_set()
{ return set {}; }

[[nodiscard]] inline set
singleton(value x)
{ return set {x}; }

} // namespace rcs
