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
#include "recset/set.hpp"
#include "recset/tuple.hpp"
#include "recset/exceptions.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <vector>

namespace {

TEST(MapTest, SetAndGet)
{
  rcs::map m;
  m.set("a", 1).set("b", 2);
  EXPECT_EQ(m.size(), 2u);
  ASSERT_TRUE(m.get("a").has_value());
  EXPECT_TRUE(rcs::equal(*m.get("a"), 1));
  EXPECT_TRUE(rcs::equal(m.at("b"), 2));
  EXPECT_FALSE(m.get("c").has_value());
  EXPECT_THROW(static_cast<void>(m.at("c")), std::out_of_range);
}

TEST(MapTest, OverwriteKeepsSize)
{
  rcs::map m {{"a", 1}};
  m.set("a", 10);
  EXPECT_EQ(m.size(), 1u);
  EXPECT_TRUE(rcs::equal(m.at("a"), 10));
}

// Transition table keyed by (state, symbol)
TEST(MapTest, TupleKeys)
{
  rcs::map delta;
  delta.set(rcs::tuple {"q0", "a"}, "q1");
  delta.set(rcs::tuple {"q1", "b"}, "q0");
  EXPECT_TRUE(rcs::equal(delta.at(rcs::tuple {"q0", "a"}), "q1"));
  EXPECT_FALSE(delta.has(rcs::tuple {"a", "q0"}));
}

TEST(MapTest, SetKeys)
{
  rcs::set k1 {1, 2};
  rcs::map m;
  m.set(k1, "x");
  EXPECT_TRUE(k1.is_frozen());
  EXPECT_TRUE(m.has(rcs::set {2, 1}));
}

TEST(MapTest, Erase)
{
  rcs::map m {{1, "one"}, {2, "two"}, {3, "three"}};
  EXPECT_TRUE(m.erase(2));
  EXPECT_FALSE(m.erase(2));
  EXPECT_EQ(m.size(), 2u);
  EXPECT_TRUE(rcs::equal(m.at(1), "one"));
  EXPECT_TRUE(rcs::equal(m.at(3), "three"));
  EXPECT_FALSE(m.has(2));
}

TEST(MapTest, EraseStress)
{
  std::mt19937 rng {1};
  std::uniform_int_distribution<int> dist {0, 199};
  rcs::map m;
  std::vector<int> shadow(200, -1);
  for (int i = 0; i < 10000; ++i)
  {
    const int k = dist(rng);
    if (rng() % 4 == 0)
    {
      EXPECT_EQ(m.erase(k), shadow[k] >= 0);
      shadow[k] = -1;
    }
    else
    {
      m.set(k, i);
      shadow[k] = i;
    }
  }

  for (int k = 0; k < 200; ++k)
  {
    const std::optional<rcs::value> v = m.get(k);
    ASSERT_EQ(v.has_value(), shadow[k] >= 0) << "key " << k;
    if (v)
      EXPECT_EQ(rcs::num_val(*v), shadow[k]);
  }
}

TEST(MapTest, EqualityIgnoresInsertionOrder)
{
  rcs::map a {{"x", 1}, {"y", 2}};
  rcs::map b {{"y", 2}, {"x", 1}};
  EXPECT_TRUE(a.equals(b));
  EXPECT_EQ(a.hash_code(), b.hash_code());

  rcs::map c {{"x", 1}, {"y", 3}};
  EXPECT_FALSE(a.equals(c));
  EXPECT_NE(a.compare(c), 0);
}

TEST(MapTest, CanonicalOrder)
{
  rcs::map m {{"b", 1}, {2, 2}, {"a", 3}, {1, 4}};
  const auto keys = m.keys();
  ASSERT_EQ(keys.size(), 4u);
  EXPECT_TRUE(rcs::equal(keys[0], 1));
  EXPECT_TRUE(rcs::equal(keys[1], 2));
  EXPECT_TRUE(rcs::equal(keys[2], "a"));
  EXPECT_TRUE(rcs::equal(keys[3], "b"));

  const auto values = m.values();
  EXPECT_TRUE(rcs::equal(values[0], 4));
  EXPECT_TRUE(rcs::equal(values[3], 1));

  const auto entries = m.entries();
  EXPECT_TRUE(rcs::equal(entries[2].first, "a"));
  EXPECT_TRUE(rcs::equal(entries[2].second, 3));
}

TEST(MapTest, FrozenRejectsMutation)
{
  rcs::map m {{1, 2}};
  static_cast<void>(m.hash_code());
  EXPECT_TRUE(m.is_frozen());
  EXPECT_THROW(m.set(3, 4), rcs::frozen_mutation_error);
  EXPECT_THROW(m.erase(1), rcs::frozen_mutation_error);
  EXPECT_THROW(m.clear(), rcs::frozen_mutation_error);
  EXPECT_EQ(m.size(), 1u);

  rcs::map copy = m.mutable_copy();
  copy.set(3, 4);
  EXPECT_EQ(copy.size(), 2u);
  EXPECT_EQ(m.size(), 1u);
}

TEST(MapTest, RejectsNonFinite)
{
  rcs::map m;
  EXPECT_THROW(m.set(std::nan(""), 1), rcs::invalid_value_error);
  EXPECT_THROW(m.set(1, INFINITY), rcs::invalid_value_error);
  EXPECT_TRUE(m.empty());
}

TEST(MapTest, Iteration)
{
  rcs::map m {{1, 10}, {2, 20}};
  double keysum = 0, valsum = 0;
  for (const auto &[k, v] : m)
  {
    keysum += rcs::num_val(k);
    valsum += rcs::num_val(v);
    // Snapshot iteration tolerates mutation
    m.set(num_val(k) + 100, 0);
  }
  EXPECT_EQ(keysum, 3);
  EXPECT_EQ(valsum, 30);
  EXPECT_EQ(m.size(), 4u);
}

TEST(MapTest, Conversion)
{
  const rcs::value x = rcs::map {};
  EXPECT_TRUE(rcs::ismap(x));
  EXPECT_TRUE(rcs::as_map(x).empty());
  EXPECT_THROW(static_cast<void>(rcs::as_map(rcs::set {})),
               std::invalid_argument);
}

} // namespace
