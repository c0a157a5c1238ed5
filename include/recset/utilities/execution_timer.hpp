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

#include <chrono>
#include <string>
#include <string_view>

namespace rcs {

/**
 * Accumulating stopwatch for code blocks
 *
 * Every stopped interval is added to per-name global statistics which can be
 * dumped with report_global_stats().
 *
 * Usage example:
 * {
 *     execution_timer timer("set::unite");
 *     // Code to measure
 * } // Interval is recorded when the timer is destroyed
 */
class execution_timer {
  public:
  /**
   * Constructor
   *
   * \param name Name of the operation being timed
   * \param auto_start Whether to start timing immediately
   */
  explicit execution_timer(std::string_view name, bool auto_start = true);

  ~execution_timer();

  /**
   * Log total and maximal durations of every timed operation
   */
  static void
  report_global_stats();

  /**
   * Drop the collected statistics
   */
  static void
  clear_global_stats();

  void
  start();

  void
  stop();

  void
  reset();

  template <typename Duration>
  Duration
  elapsed() const
  { return std::chrono::duration_cast<Duration>(m_total_duration); }

  /**
   * Log the time accumulated by this timer
   */
  void
  report() const;

  private:
  std::string m_name;
  bool m_running;
  std::chrono::time_point<std::chrono::steady_clock> m_start_time;
  std::chrono::nanoseconds m_total_duration;
}; // class rcs::execution_timer

} // namespace rcs


#ifdef RECSET_ENABLE_BENCHMARKS
# define RECSET_BENCHMARK_CONCAT_(a, b) a ## b
# define RECSET_BENCHMARK_CONCAT(a, b) RECSET_BENCHMARK_CONCAT_(a, b)
/** Time the enclosing scope under \p name */
# define RECSET_BENCHMARK(name) \
  rcs::execution_timer RECSET_BENCHMARK_CONCAT(_recset_timer_, __LINE__) {name};
#else
# define RECSET_BENCHMARK(name)
#endif

/** Time the enclosing function */
#define RECSET_FUNCTION_BENCHMARK RECSET_BENCHMARK(__func__)
