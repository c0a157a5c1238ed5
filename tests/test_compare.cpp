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
#include "recset/stl/vector.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <string>

namespace {

int
sign(int x)
{ return x < 0 ? -1 : x > 0 ? 1 : 0; }


// Random nested value over a small domain so that equal values show up
rcs::value
random_value(std::mt19937 &rng, int depth)
{
  const int kind = depth > 0 ? int(rng() % 6) : int(rng() % 2);
  const size_t len = rng() % 4;
  switch (kind)
  {
    case 0:
      return rcs::num(double(int(rng() % 7) - 3) / 2);

    case 1:
      return rcs::str(std::string(1, char('a' + rng() % 3)));

    case 2:
    {
      rcs::sequence ret;
      for (size_t i = 0; i < len; ++i)
        ret.push_back(random_value(rng, depth - 1));
      return ret;
    }

    case 3:
    {
      rcs::stl::vector<rcs::value> elements;
      for (size_t i = 0; i < len; ++i)
        elements.push_back(random_value(rng, depth - 1));
      return rcs::tuple::from(elements);
    }

    case 4:
    {
      rcs::set ret;
      for (size_t i = 0; i < len; ++i)
        ret.add(random_value(rng, depth - 1));
      return ret;
    }

    default:
    {
      rcs::map ret;
      for (size_t i = 0; i < len; ++i)
        ret.set(random_value(rng, depth - 1), random_value(rng, depth - 1));
      return ret;
    }
  }
}


TEST(CompareTest, RankOrder)
{
  EXPECT_LT(rcs::compare(100, "a"), 0);
  EXPECT_GT(rcs::compare("a", 100), 0);
  EXPECT_LT(rcs::compare("zzz", rcs::set {}), 0);
  EXPECT_LT(rcs::compare(-1, rcs::tuple {}), 0);
  EXPECT_GT(rcs::compare(rcs::map {}, "a"), 0);
}

TEST(CompareTest, Primitives)
{
  EXPECT_LT(rcs::compare(1, 2), 0);
  EXPECT_GT(rcs::compare(2.5, -2.5), 0);
  EXPECT_EQ(rcs::compare(0.0, -0.0), 0);
  EXPECT_LT(rcs::compare("abc", "abd"), 0);
  EXPECT_LT(rcs::compare("ab", "abc"), 0);
  EXPECT_EQ(rcs::compare("x", "x"), 0);
}

TEST(CompareTest, Identity)
{
  const rcs::set s {1, 2};
  EXPECT_EQ(rcs::compare(s, s), 0);
  EXPECT_TRUE(rcs::is(s, s));
}

TEST(CompareTest, ContainersOfDifferentKinds)
{
  // Same elements, different kinds: never equal
  const rcs::value t = rcs::tuple {1, 2};
  const rcs::value q = rcs::sequence {1, 2};
  EXPECT_NE(rcs::compare(t, q), 0);
  EXPECT_EQ(sign(rcs::compare(t, q)), -sign(rcs::compare(q, t)));
  EXPECT_FALSE(rcs::equal(t, q));
}

TEST(CompareTest, LessOrdersSets)
{
  rcs::stl::vector<rcs::value> xs;
  xs.push_back("b");
  xs.push_back(rcs::set {1});
  xs.push_back(3);
  xs.push_back("a");
  std::ranges::sort(xs, rcs::less {});
  EXPECT_TRUE(rcs::equal(xs[0], 3));
  EXPECT_TRUE(rcs::equal(xs[1], "a"));
  EXPECT_TRUE(rcs::equal(xs[2], "b"));
  EXPECT_TRUE(rcs::isset(xs[3]));
}

// Total order laws over random nested values
TEST(CompareTest, OrderLaws)
{
  std::mt19937 rng {2025};
  rcs::stl::vector<rcs::value> pool;
  for (int i = 0; i < 120; ++i)
    pool.push_back(random_value(rng, 3));

  for (size_t i = 0; i < pool.size(); ++i)
  {
    const rcs::value a = pool[i];
    EXPECT_EQ(rcs::compare(a, a), 0);
    for (size_t j = 0; j < pool.size(); ++j)
    {
      const rcs::value b = pool[j];
      const int ab = sign(rcs::compare(a, b));
      const int ba = sign(rcs::compare(b, a));
      ASSERT_EQ(ab, -ba) << rcs::to_string(a) << " vs " << rcs::to_string(b);
      ASSERT_EQ(ab == 0, rcs::equal(a, b))
          << rcs::to_string(a) << " vs " << rcs::to_string(b);
      if (ab == 0)
        ASSERT_EQ(rcs::hash(a), rcs::hash(b));
    }
  }

  for (int n = 0; n < 20000; ++n)
  {
    const rcs::value a = pool[rng() % pool.size()];
    const rcs::value b = pool[rng() % pool.size()];
    const rcs::value c = pool[rng() % pool.size()];
    if (rcs::compare(a, b) <= 0 and rcs::compare(b, c) <= 0)
      ASSERT_LE(rcs::compare(a, c), 0);
  }
}

// Values built independently from the same seed are equal but distinct
TEST(CompareTest, StructuralEquality)
{
  std::mt19937 rng1 {99}, rng2 {99};
  for (int i = 0; i < 200; ++i)
  {
    const rcs::value a = random_value(rng1, 3);
    const rcs::value b = random_value(rng2, 3);
    ASSERT_TRUE(rcs::equal(a, b)) << rcs::to_string(a);
    ASSERT_EQ(rcs::compare(a, b), 0);
    ASSERT_EQ(rcs::hash(a), rcs::hash(b));
    ASSERT_EQ(rcs::to_string(a), rcs::to_string(b));
  }
}

} // namespace
