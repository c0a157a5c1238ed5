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

/**
 * \file recset.hpp
 * All public headers of the library
 */

#include "recset/value.hpp"
#include "recset/exceptions.hpp"
#include "recset/hash.hpp"
#include "recset/sequence.hpp"
#include "recset/tuple.hpp"
#include "recset/set.hpp"
#include "recset/map.hpp"
#include "recset/foundation.hpp"
#include "recset/format.hpp"
#include "recset/logging.hpp"
#include "recset/literal_parser.hpp"
#include "recset/literal_reader.hpp"
