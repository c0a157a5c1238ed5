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

#include <functional>

/**
 * \file hash.hpp
 * Hashing support for standard containers
 *
 * \ingroup hash
 */


namespace rcs {

/**
 * Equality predicate matching std::hash<rcs::value>
 *
 * \ingroup hash
 */
struct equal_to {
  bool
  operator () (const value &a, const value &b) const
  { return equal(a, b); }
}; // struct rcs::equal_to

} // namespace rcs


/**
 * Specialization of std::hash for rcs::value
 *
 * \note Hashing a container freezes it.
 *
 * \ingroup hash
 */
template <>
struct std::hash<rcs::value> {
  size_t
  operator () (const rcs::value &x) const
  { return rcs::hash(x); }
}; // struct std::hash<rcs::value>
