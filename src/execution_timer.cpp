/*
 * Kontra - continuation-passing style conversion for probabilistic programs
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


#include "kontra/utilities/execution_timer.hpp"
#include "kontra/logging.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>


namespace kon {

static
std::unordered_map<std::string, std::chrono::nanoseconds> g_total_duration;
static
std::unordered_map<std::string, std::chrono::nanoseconds> g_max_duration;
// Guards both maps; timers run on every thread that converts terms
static std::mutex g_stats_mutex;

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
  if (not m_running)
    return;

  const std::chrono::nanoseconds duration =
      std::chrono::steady_clock::now() - m_start_time;
  m_total_duration += duration;
  m_running = false;

  std::lock_guard<std::mutex> lock {g_stats_mutex};
  g_total_duration[m_name] += duration;
  std::chrono::nanoseconds &max = g_max_duration[m_name];
  if (duration > max)
    max = duration;
}

std::chrono::nanoseconds
execution_timer::total_duration(std::string_view name)
{
  std::lock_guard<std::mutex> lock {g_stats_mutex};
  const auto it = g_total_duration.find(std::string {name});
  return it == g_total_duration.end() ? std::chrono::nanoseconds::zero()
                                      : it->second;
}

static std::string
_format_duration(std::chrono::nanoseconds duration)
{
  const double ms =
      std::chrono::duration<double, std::milli>(duration).count();
  if (ms < 1.0)
    return std::format("{:.3f} μs", ms * 1000.0);
  else if (ms < 1000.0)
    return std::format("{:.3f} ms", ms);
  else
    return std::format("{:.3f} s", ms / 1000.0);
}

void
execution_timer::report_global_stats()
{
  std::multimap<std::chrono::nanoseconds, std::string, std::greater<>> entries;
  {
    std::lock_guard<std::mutex> lock {g_stats_mutex};
    for (const auto &[name, duration] : g_total_duration)
    {
      const std::string text =
          std::format("\e[1m{:20}\e[0m - total: {}, max: {}", name,
                      _format_duration(duration),
                      _format_duration(g_max_duration[name]));
      entries.emplace(duration, text);
    }
  }

  for (const auto &[_, text] : entries)
    info("{}", text);
}

} // namespace kon
