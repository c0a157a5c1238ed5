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

#include <stdexcept>
#include <string>
#include <string_view>

/**
 * \file exceptions.hpp
 * Errors raised by container operations
 *
 * All of them are raised before the receiver is modified, so a failed
 * operation leaves the container exactly as it was.
 *
 * \ingroup core
 */


namespace rcs {

/**
 * Base class for precondition violations of container operations
 *
 * \ingroup core
 */
struct container_error: std::runtime_error {
  using runtime_error::runtime_error;
}; // struct rcs::container_error


/**
 * Mutation of a frozen container
 *
 * \ingroup core
 */
struct frozen_mutation_error: container_error {
  frozen_mutation_error(std::string_view operation, tag kind);

  /** Name of the rejected operation */
  const std::string&
  operation() const noexcept
  { return m_operation; }

  /** Kind of the frozen container */
  tag
  kind() const noexcept
  { return m_kind; }

  private:
  std::string m_operation;
  tag m_kind;
}; // struct rcs::frozen_mutation_error


/**
 * Insertion of NaN or an infinite number
 *
 * \ingroup core
 */
struct invalid_value_error: container_error {
  invalid_value_error(std::string_view operation, value x);
}; // struct rcs::invalid_value_error


/**
 * Violation of the foundation axiom: the inserted value contains the
 * receiver, directly or transitively
 *
 * \ingroup core
 */
struct cycle_violation_error: container_error {
  cycle_violation_error(std::string_view operation, tag kind);
}; // struct rcs::cycle_violation_error


/**
 * Result would exceed a configured safety bound
 *
 * \ingroup core
 */
struct capacity_exceeded_error: container_error {
  capacity_exceeded_error(std::string_view operation, size_t requested,
                          size_t limit);

  size_t
  requested() const noexcept
  { return m_requested; }

  size_t
  limit() const noexcept
  { return m_limit; }

  private:
  size_t m_requested;
  size_t m_limit;
}; // struct rcs::capacity_exceeded_error


/**
 * Throw frozen_mutation_error if \p x is frozen
 *
 * \ingroup core
 */
inline void
require_mutable(value x, std::string_view operation)
{
  if (x->frozen)
    throw frozen_mutation_error {operation, x->t};
}

/**
 * Throw invalid_value_error if \p x is a non-finite number
 *
 * \ingroup core
 */
inline void
require_storable(value x, std::string_view operation)
{
  if (not is_storable(x))
    throw invalid_value_error {operation, x};
}

} // namespace rcs
