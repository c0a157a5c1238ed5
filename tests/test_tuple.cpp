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
#include "recset/set.hpp"
#include "recset/exceptions.hpp"

#include <gtest/gtest.h>
#include <cmath>

namespace {

TEST(TupleTest, Construction)
{
  const rcs::tuple t {1, "two", 3.5};
  EXPECT_EQ(t.size(), 3u);
  EXPECT_TRUE(rcs::equal(t[0], 1));
  EXPECT_TRUE(rcs::equal(t.at(1), "two"));
  EXPECT_THROW(static_cast<void>(t.at(3)), std::out_of_range);
  EXPECT_TRUE(rcs::tuple {}.empty());
}

TEST(TupleTest, BornFrozen)
{
  const rcs::tuple t {1, 2};
  EXPECT_TRUE(rcs::is_frozen(t));
}

TEST(TupleTest, FreezesElements)
{
  rcs::set inner {1};
  const rcs::tuple t {inner, 2};
  EXPECT_TRUE(inner.is_frozen());
  EXPECT_THROW(inner.add(2), rcs::frozen_mutation_error);
}

TEST(TupleTest, CopiesInput)
{
  rcs::stl::vector<rcs::value> elements;
  elements.push_back(1);
  elements.push_back(2);
  const rcs::tuple t = rcs::tuple::from(elements);
  elements[0] = 100;
  EXPECT_TRUE(rcs::equal(t[0], 1));
}

TEST(TupleTest, PositionalEquality)
{
  const rcs::tuple a {1, 2};
  const rcs::tuple b {1, 2};
  const rcs::tuple c {2, 1};
  EXPECT_TRUE(a.equals(b));
  EXPECT_FALSE(rcs::is(a, b));
  EXPECT_FALSE(a.equals(c));
  EXPECT_FALSE(a.equals(rcs::tuple {1, 2, 3}));
  EXPECT_NE(a.compare(c), 0);
}

TEST(TupleTest, RejectsNonFinite)
{
  EXPECT_THROW(rcs::tuple({1, std::nan("")}), rcs::invalid_value_error);
}

TEST(TupleTest, Iteration)
{
  const rcs::tuple t {1, 2, 3};
  double sum = 0;
  for (const rcs::value &x : t)
    sum += rcs::num_val(x);
  EXPECT_EQ(sum, 6);
}

TEST(TupleTest, Conversion)
{
  const rcs::value x = rcs::tuple {1};
  EXPECT_TRUE(rcs::istuple(x));
  EXPECT_EQ(rcs::as_tuple(x).size(), 1u);
  EXPECT_THROW(static_cast<void>(rcs::as_tuple("x")), std::invalid_argument);
}

} // namespace
