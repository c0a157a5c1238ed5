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


#include "recset/tuple.hpp"
#include "recset/exceptions.hpp"
#include "recset/detail/bodies.hpp"

#include <format>


rcs::tuple::tuple()
: tuple(static_cast<const value*>(nullptr), 0)
{ }


rcs::tuple::tuple(std::initializer_list<value> elements)
: tuple(elements.begin(), elements.size())
{ }


rcs::tuple::tuple(const value *data, size_t len)
: value {make<object>(tag::tuple)}
{
  for (size_t i = 0; i < len; ++i)
    require_storable(data[i], "construct tuple");

  (*this)->tup.data = copy_array(data, len);
  (*this)->tup.len = len;
  (*this)->hash = detail::tuple_hash(data, len);
  (*this)->frozen = true;
}


const rcs::value&
rcs::tuple::at(size_t i) const
{
  if (i >= size())
  {
    throw std::out_of_range {
        std::format("tuple::at() - index {} out of range (size {})", i, size())};
  }
  return (*this)->tup.data[i];
}


rcs::tuple
rcs::as_tuple(value x)
{
  if (not istuple(x))
    throw std::invalid_argument {"as_tuple() - not a tuple"};
  return tuple(&*x);
}
