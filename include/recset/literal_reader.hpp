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

#include "recset/literal_parser.hpp"
#include "recset/stl/deque.hpp"
#include "recset/value.hpp"

#include <optional>
#include <string>

/**
 * \file literal_reader.hpp
 * Incremental reading of literals
 *
 * \ingroup literals
 */


namespace rcs {

/**
 * Utility class allowing gradual parsing of text fragments into values
 *
 * Text that does not yet form a complete literal is kept until more input
 * arrives. Malformed input is reported by operator<< and discarded.
 *
 * \ingroup literals
 */
class literal_reader {
  public:
  literal_reader(literal_parser &parser);

  /**
   * Feed a text fragment
   *
   * \throws parse_error If the accumulated text can not become a literal
   */
  void
  operator << (const std::string &input);

  /**
   * Take the next complete value
   *
   * \return Whether a value was available
   */
  bool
  operator >> (std::optional<value> &result);

  /**
   * Check whether a literal is being accumulated
   */
  bool
  pending() const;

  private:
  literal_parser &m_parser;
  std::string m_buffer;
  stl::deque<value> m_values;
}; // class rcs::literal_reader

} // namespace rcs
