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


#include "recset/sequence.hpp"
#include "recset/exceptions.hpp"
#include "recset/foundation.hpp"

#include <format>


static rcs::object*
_make_sequence()
{
  rcs::object *obj = rcs::make<rcs::object>(rcs::tag::seq);
  obj->seq = rcs::make<rcs::detail::sequence_body>();
  return obj;
}


rcs::sequence::sequence()
: value {_make_sequence()}
{ }


rcs::sequence::sequence(std::initializer_list<value> elements)
: sequence()
{
  body().elements.reserve(elements.size());
  for (const value &x : elements)
  {
    require_storable(x, "construct sequence");
    body().elements.push_back(x);
  }
}


rcs::sequence&
rcs::sequence::push_back(value x)
{
  require_mutable(*this, "push_back");
  require_storable(x, "push_back");
  require_well_founded(x, *this, "push_back");
  body().elements.push_back(x);
  return *this;
}


rcs::value
rcs::sequence::pop_back()
{
  require_mutable(*this, "pop_back");
  if (empty())
    throw std::out_of_range {"sequence::pop_back() - empty sequence"};
  const value ret = body().elements.back();
  body().elements.pop_back();
  return ret;
}


rcs::sequence&
rcs::sequence::assign(size_t i, value x)
{
  require_mutable(*this, "assign");
  if (i >= size())
  {
    throw std::out_of_range {
        std::format("sequence::assign() - index {} out of range (size {})", i,
                    size())};
  }
  require_storable(x, "assign");
  require_well_founded(x, *this, "assign");
  body().elements[i] = x;
  return *this;
}


void
rcs::sequence::clear()
{
  require_mutable(*this, "clear");
  body().elements.clear();
}


const rcs::value&
rcs::sequence::at(size_t i) const
{
  if (i >= size())
  {
    throw std::out_of_range {
        std::format("sequence::at() - index {} out of range (size {})", i,
                    size())};
  }
  return body().elements[i];
}


rcs::detail::value_cursor
rcs::sequence::begin() const
{
  const auto &elements = body().elements;
  return {detail::snapshot(elements.data(), elements.size(), is_frozen()),
          elements.size()};
}


rcs::sequence
rcs::sequence::mutable_copy() const
{
  sequence ret;
  ret.body().elements = body().elements;
  return ret;
}


rcs::sequence
rcs::as_seq(value x)
{
  if (not isseq(x))
    throw std::invalid_argument {"as_seq() - not a sequence"};
  return sequence(&*x);
}
