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


#include "recset/utilities/execution_timer.hpp"
#include "recset/logging.hpp"

#include <functional>
#include <map>
#include <unordered_map>


namespace rcs {

struct timer_stats {
  std::chrono::nanoseconds total {0};
  std::chrono::nanoseconds max {0};
  size_t count = 0;
}; // struct rcs::timer_stats

static
std::unordered_map<std::string, timer_stats> g_stats;


static std::string
format_duration(std::chrono::nanoseconds duration)
{
  const double us = std::chrono::duration<double, std::micro>(duration).count();
  if (us < 1000.0)
    return std::format("{:.3f} μs", us);
  else if (us < 1000000.0)
    return std::format("{:.3f} ms", us / 1000.0);
  else
    return std::format("{:.3f} s", us / 1000000.0);
}


execution_timer::execution_timer(std::string_view name, bool auto_start)
: m_name {name},
  m_running {false},
  m_total_duration {std::chrono::nanoseconds::zero()}
{
  if (auto_start)
    start();
}

execution_timer::~execution_timer()
{
  if (m_running)
    stop();
}

void
execution_timer::start()
{
  if (not m_running)
  {
    m_start_time = std::chrono::steady_clock::now();
    m_running = true;
  }
}

void
execution_timer::stop()
{
  if (m_running)
  {
    const auto duration = std::chrono::steady_clock::now() - m_start_time;
    m_total_duration += duration;
    m_running = false;

    timer_stats &stats = g_stats[m_name];
    stats.total += duration;
    stats.count += 1;
    if (duration > stats.max)
      stats.max = duration;
  }
}

void
execution_timer::reset()
{
  m_running = false;
  m_total_duration = std::chrono::nanoseconds::zero();
}

void
execution_timer::report() const
{
  info("\e[1m{}\e[0m completed in {}", m_name,
       format_duration(m_total_duration));
}

void
execution_timer::report_global_stats()
{
  // Longest total first
  std::multimap<std::chrono::nanoseconds, std::string, std::greater<>> entries;
  for (const auto &[name, stats] : g_stats)
  {
    entries.emplace(stats.total,
                    std::format("\e[1m{:24}\e[0m - calls: {}, total: {}, max: {}",
                                name, stats.count,
                                format_duration(stats.total),
                                format_duration(stats.max)));
  }

  for (const auto &[_, text] : entries)
    info("{}", text);
}

void
execution_timer::clear_global_stats()
{ g_stats.clear(); }

} // namespace rcs
