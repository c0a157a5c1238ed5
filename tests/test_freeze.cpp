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


#include "recset/map.hpp"
#include "recset/sequence.hpp"
#include "recset/set.hpp"
#include "recset/tuple.hpp"
#include "recset/exceptions.hpp"

#include <gtest/gtest.h>

namespace {

TEST(FreezeTest, CreatedMutable)
{
  EXPECT_FALSE(rcs::set {}.is_frozen());
  EXPECT_FALSE(rcs::map {}.is_frozen());
  EXPECT_FALSE(rcs::sequence {}.is_frozen());
}

TEST(FreezeTest, HashCodeFreezes)
{
  rcs::set s {1};
  static_cast<void>(s.hash_code());
  EXPECT_TRUE(s.is_frozen());
  EXPECT_THROW(s.add(2), rcs::frozen_mutation_error);
  EXPECT_THROW(s.remove(1), rcs::frozen_mutation_error);
  EXPECT_THROW(s.clear(), rcs::frozen_mutation_error);
  EXPECT_THROW(s.reserve(100), rcs::frozen_mutation_error);
  EXPECT_EQ(s.size(), 1u);
}

TEST(FreezeTest, ErrorCarriesOperation)
{
  rcs::set s;
  s.freeze();
  try
  {
    s.add(1);
    FAIL() << "expected frozen_mutation_error";
  }
  catch (const rcs::frozen_mutation_error &exn)
  {
    EXPECT_EQ(exn.operation(), "add");
    EXPECT_EQ(exn.kind(), rcs::tag::set);
  }
}

TEST(FreezeTest, Transitive)
{
  rcs::set inner {1};
  rcs::set outer;
  outer.add(inner);
  static_cast<void>(outer.hash_code());
  EXPECT_THROW(inner.add(2), rcs::frozen_mutation_error);
}

TEST(FreezeTest, InsertionFreezesElement)
{
  rcs::sequence key {1, 2};
  rcs::set s;
  s.add(key);
  EXPECT_TRUE(key.is_frozen());
  EXPECT_THROW(key.push_back(3), rcs::frozen_mutation_error);
  EXPECT_TRUE(s.has(rcs::sequence {1, 2}));
}

TEST(FreezeTest, MapKeysFrozenOnInsertion)
{
  rcs::set key {1};
  rcs::map m;
  m.set(key, 0);
  EXPECT_TRUE(key.is_frozen());

  // Values are frozen lazily with the map
  rcs::set val {2};
  m.set(2, val);
  EXPECT_FALSE(val.is_frozen());
  m.freeze();
  EXPECT_TRUE(val.is_frozen());
}

TEST(FreezeTest, MutableCopyThaws)
{
  rcs::set inner {1};
  rcs::set outer;
  outer.add(inner);
  outer.freeze();

  rcs::set copy = outer.mutable_copy();
  EXPECT_FALSE(copy.is_frozen());
  copy.add(2);
  EXPECT_EQ(outer.size(), 1u);

  // Elements stay shared and frozen
  EXPECT_TRUE(inner.is_frozen());
}

TEST(FreezeTest, FrozenIterationIsStable)
{
  rcs::set s {1, 2, 3};
  s.freeze();
  size_t n = 0;
  for ([[maybe_unused]] const rcs::value &x : s)
    n++;
  EXPECT_EQ(n, 3u);
}

} // namespace
