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


#include "recset/exceptions.hpp"

#include <format>


rcs::frozen_mutation_error::frozen_mutation_error(std::string_view operation,
                                                  tag kind)
: container_error {std::format("cannot {} a frozen {}; use mutable_copy() to "
                               "obtain a mutable instance",
                               operation, tag_name(kind))},
  m_operation {operation},
  m_kind {kind}
{ }


rcs::invalid_value_error::invalid_value_error(std::string_view operation,
                                              value x)
: container_error {std::format("{}: non-finite number {} can not be stored in "
                               "a container",
                               operation, num_val(x))}
{ }


rcs::cycle_violation_error::cycle_violation_error(std::string_view operation,
                                                  tag kind)
: container_error {std::format("{}: inserted value contains the receiving {} "
                               "(a container can not be its own member)",
                               operation, tag_name(kind))}
{ }


rcs::capacity_exceeded_error::capacity_exceeded_error(
    std::string_view operation, size_t requested, size_t limit)
: container_error {std::format("{}: {} elements exceed the limit of {}",
                               operation, requested, limit)},
  m_requested {requested},
  m_limit {limit}
{ }
