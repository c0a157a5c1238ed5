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


#include "recset/detail/probe_table.hpp"

#include <gtest/gtest.h>

namespace {

using rcs::detail::hash_array;
using rcs::detail::probe_table;


// Look up a dense index by its hash
size_t
lookup(const probe_table &table, const hash_array &hashes, size_t index)
{
  return table.find(hashes[index], [&](size_t i) { return i == index; })
      .index;
}


void
insert(probe_table &table, hash_array &hashes, uint32_t hash)
{
  if (table.must_grow(hashes.size()))
    table.rebuild(table.bucket_count() * 2, hashes);
  const size_t index = hashes.size();
  const auto r = table.find(hash, [](size_t) { return false; });
  table.occupy(r.slot, index);
  hashes.push_back(hash);
}


TEST(ProbeTableTest, BucketsFor)
{
  EXPECT_EQ(probe_table::buckets_for(0), probe_table::min_buckets);
  EXPECT_EQ(probe_table::buckets_for(12), 16u);
  EXPECT_EQ(probe_table::buckets_for(13), 32u);
  EXPECT_EQ(probe_table::buckets_for(1000), 2048u);
}

TEST(ProbeTableTest, LoadFactor)
{
  probe_table table;
  EXPECT_FALSE(table.must_grow(10));
  EXPECT_TRUE(table.must_grow(12));
}

TEST(ProbeTableTest, EmptyFind)
{
  probe_table table;
  const auto r = table.find(5, [](size_t) { return true; });
  EXPECT_FALSE(r.found());
  EXPECT_EQ(r.slot, 5u);
}

// All entries share a bucket; removing from the middle of the chain must
// keep the tail reachable
TEST(ProbeTableTest, VacateShiftsChain)
{
  probe_table table;
  hash_array hashes;
  for (int i = 0; i < 5; ++i)
    insert(table, hashes, 3);

  const size_t slot = table.find(3, [](size_t i) { return i == 1; }).slot;
  table.vacate(slot, hashes);

  EXPECT_FALSE(table.find(3, [](size_t i) { return i == 1; }).found());
  for (size_t i : {0u, 2u, 3u, 4u})
    EXPECT_EQ(lookup(table, hashes, i), i);
}

// An entry sitting in its own ideal bucket stays put
TEST(ProbeTableTest, VacateKeepsHomeEntries)
{
  probe_table table;
  hash_array hashes;
  insert(table, hashes, 3);  // slot 3
  insert(table, hashes, 3);  // slot 4
  insert(table, hashes, 4);  // slot 5, ideal 4
  insert(table, hashes, 6);  // slot 6, home

  table.vacate(3, hashes);
  EXPECT_EQ(lookup(table, hashes, 1), 1u);
  EXPECT_EQ(lookup(table, hashes, 2), 2u);
  EXPECT_EQ(lookup(table, hashes, 3), 3u);
  EXPECT_EQ(table.find(6, [](size_t i) { return i == 3; }).slot, 6u);
}

TEST(ProbeTableTest, WrapAround)
{
  probe_table table;
  hash_array hashes;
  insert(table, hashes, 15);
  insert(table, hashes, 15); // wraps to slot 0
  insert(table, hashes, 0);  // slot 1

  EXPECT_EQ(table.find(15, [](size_t i) { return i == 1; }).slot, 0u);
  table.vacate(15, hashes);
  EXPECT_EQ(table.find(15, [](size_t i) { return i == 1; }).slot, 15u);
  EXPECT_EQ(table.find(0, [](size_t i) { return i == 2; }).slot, 0u);
}

TEST(ProbeTableTest, RetargetAndRebuild)
{
  probe_table table;
  hash_array hashes;
  for (uint32_t h = 0; h < 40; ++h)
    insert(table, hashes, h * 7);
  EXPECT_GE(table.bucket_count(), 64u);
  for (size_t i = 0; i < hashes.size(); ++i)
    EXPECT_EQ(lookup(table, hashes, i), i);

  // Move the last entry to index 0 the way swap-and-pop does
  const size_t slot0 = table.find(hashes[0], [](size_t i) { return i == 0; })
                           .slot;
  table.vacate(slot0, hashes);
  table.retarget(hashes[39], 39, 0);
  hashes[0] = hashes[39];
  hashes.pop_back();
  EXPECT_EQ(lookup(table, hashes, 0), 0u);

  table.reset();
  EXPECT_EQ(table.bucket_count(), probe_table::min_buckets);
  EXPECT_FALSE(table.find(hashes[0], [](size_t) { return true; }).found());
}

} // namespace
