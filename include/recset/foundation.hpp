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

#include <string_view>

/**
 * \file foundation.hpp
 * Well-foundedness of container membership
 *
 * No container may contain itself, directly or through a chain of
 * memberships.
 *
 * \ingroup containers
 */


namespace rcs {

/**
 * Check whether \p target is \p from or is reachable from it through
 * container membership
 *
 * \ingroup containers
 */
[[nodiscard]] bool
reaches(value from, value target);

/**
 * Throw cycle_violation_error if inserting \p x into \p receiver would make
 * \p receiver a member of itself
 *
 * \ingroup containers
 */
void
require_well_founded(value x, value receiver, std::string_view operation);

} // namespace rcs
