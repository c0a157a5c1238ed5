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


#include "recset/logging.hpp"
#include "recset/set.hpp"
#include "recset/utilities/execution_timer.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

namespace {

class LoggingTest: public ::testing::Test {
  protected:
  void
  SetUp() override
  { m_saved = rcs::loglevel; }

  void
  TearDown() override
  { rcs::loglevel = m_saved; }

  private:
  enum rcs::loglevel m_saved;
};

TEST_F(LoggingTest, LevelNames)
{
  for (const char *name : {"silent", "error", "warning", "info", "debug"})
    EXPECT_EQ(rcs::loglevel_name(rcs::parse_loglevel(name)), name);
  EXPECT_THROW(rcs::parse_loglevel("verbose"), std::runtime_error);
}

TEST_F(LoggingTest, Filtering)
{
  rcs::loglevel = rcs::loglevel::warning;
  testing::internal::CaptureStderr();
  rcs::info("hidden {}", 1);
  rcs::warning("shown {}", 2);
  const std::string out = testing::internal::GetCapturedStderr();
  EXPECT_EQ(out.find("hidden"), std::string::npos);
  EXPECT_NE(out.find("shown 2"), std::string::npos);
}

TEST_F(LoggingTest, Silent)
{
  rcs::loglevel = rcs::loglevel::silent;
  testing::internal::CaptureStderr();
  rcs::error("nothing");
  EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());
}

TEST_F(LoggingTest, MultilineMessage)
{
  rcs::loglevel = rcs::loglevel::info;
  testing::internal::CaptureStderr();
  rcs::info("first\nsecond");
  const std::string out = testing::internal::GetCapturedStderr();
  EXPECT_EQ(out.rfind("recset ", 0), 0u);
  EXPECT_NE(out.find("\n       "), std::string::npos);
  EXPECT_NE(out.find("second"), std::string::npos);
}

TEST_F(LoggingTest, FormatsValues)
{
  rcs::loglevel = rcs::loglevel::info;
  testing::internal::CaptureStderr();
  rcs::info("set: {}", rcs::set {2, 1});
  EXPECT_NE(testing::internal::GetCapturedStderr().find("set: {1, 2}"),
            std::string::npos);
}

TEST(ExecutionTimerTest, Elapsed)
{
  rcs::execution_timer timer {"sleep"};
  std::this_thread::sleep_for(std::chrono::milliseconds {5});
  timer.stop();
  EXPECT_GE(timer.elapsed<std::chrono::milliseconds>().count(), 5);

  // Stopped timer does not advance
  const auto t = timer.elapsed<std::chrono::nanoseconds>();
  std::this_thread::sleep_for(std::chrono::milliseconds {1});
  EXPECT_EQ(timer.elapsed<std::chrono::nanoseconds>(), t);

  timer.reset();
  EXPECT_EQ(timer.elapsed<std::chrono::nanoseconds>().count(), 0);
}

TEST(ExecutionTimerTest, GlobalStats)
{
  const enum rcs::loglevel saved = rcs::loglevel;
  rcs::loglevel = rcs::loglevel::info;
  rcs::execution_timer::clear_global_stats();
  {
    rcs::execution_timer a {"stats-probe"};
  }
  {
    rcs::execution_timer b {"stats-probe"};
  }
  testing::internal::CaptureStderr();
  rcs::execution_timer::report_global_stats();
  const std::string out = testing::internal::GetCapturedStderr();
  rcs::loglevel = saved;
  EXPECT_NE(out.find("stats-probe"), std::string::npos);
  EXPECT_NE(out.find("calls: 2"), std::string::npos);
}

} // namespace
