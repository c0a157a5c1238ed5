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
#include "recset/set.hpp"
#include "recset/exceptions.hpp"

#include <gtest/gtest.h>
#include <cmath>

namespace {

TEST(SequenceTest, PushAndPop)
{
  rcs::sequence s;
  s.push_back(1).push_back("a");
  EXPECT_EQ(s.size(), 2u);
  EXPECT_TRUE(rcs::equal(s.pop_back(), "a"));
  EXPECT_TRUE(rcs::equal(s.pop_back(), 1));
  EXPECT_TRUE(s.empty());
  EXPECT_THROW(static_cast<void>(s.pop_back()), std::out_of_range);
}

TEST(SequenceTest, AssignAndAt)
{
  rcs::sequence s {1, 2, 3};
  s.assign(1, "x");
  EXPECT_TRUE(rcs::equal(s.at(1), "x"));
  EXPECT_THROW(s.assign(3, 0), std::out_of_range);
  EXPECT_THROW(static_cast<void>(s.at(3)), std::out_of_range);
}

TEST(SequenceTest, KeepsDuplicatesAndOrder)
{
  rcs::sequence a {1, 1, 2};
  rcs::sequence b {1, 2, 1};
  EXPECT_EQ(a.size(), 3u);
  EXPECT_FALSE(a.equals(b));
  EXPECT_TRUE(a.equals(rcs::sequence {1, 1, 2}));
}

TEST(SequenceTest, FrozenRejectsMutation)
{
  rcs::sequence s {1};
  s.freeze();
  EXPECT_THROW(s.push_back(2), rcs::frozen_mutation_error);
  EXPECT_THROW(static_cast<void>(s.pop_back()), rcs::frozen_mutation_error);
  EXPECT_THROW(s.assign(0, 2), rcs::frozen_mutation_error);
  EXPECT_THROW(s.clear(), rcs::frozen_mutation_error);
  EXPECT_EQ(s.size(), 1u);

  rcs::sequence copy = s.mutable_copy();
  copy.push_back(2);
  EXPECT_EQ(copy.size(), 2u);
  EXPECT_EQ(s.size(), 1u);
}

TEST(SequenceTest, RejectsNonFinite)
{
  rcs::sequence s;
  EXPECT_THROW(s.push_back(std::nan("")), rcs::invalid_value_error);
  EXPECT_THROW(rcs::sequence({1, HUGE_VAL}), rcs::invalid_value_error);
}

TEST(SequenceTest, IterationIsSnapshot)
{
  rcs::sequence s {1, 2};
  size_t n = 0;
  for ([[maybe_unused]] const rcs::value &x : s)
  {
    s.push_back(0);
    n++;
  }
  EXPECT_EQ(n, 2u);
  EXPECT_EQ(s.size(), 4u);
}

TEST(SequenceTest, NestingFreezesOnHash)
{
  rcs::sequence inner {1};
  rcs::sequence outer;
  outer.push_back(inner);
  EXPECT_FALSE(inner.is_frozen());
  static_cast<void>(outer.hash_code());
  EXPECT_TRUE(inner.is_frozen());
}

} // namespace
