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


#pragma once

#include <chrono>
#include <string>
#include <string_view>


#define KON_CONCAT_IMPL(a, b) a##b
#define KON_CONCAT(a, b) KON_CONCAT_IMPL(a, b)

/**
 * Measure execution time of the enclosing function
 */
#define KON_FUNCTION_BENCHMARK \
  ::kon::execution_timer KON_CONCAT(_kon_timer_, __LINE__) {__func__};


namespace kon {

/**
 * Measure execution time of a code block
 *
 * Timing starts on construction and stops on destruction (or on stop()).
 * Durations are accumulated per name into process-wide statistics which can
 * be printed with report_global_stats().
 *
 * ```
 * {
 *   execution_timer timer {"lift applications"};
 *   // Code to measure
 * }
 * ```
 */
class execution_timer {
  public:
  explicit execution_timer(std::string_view name, bool auto_start = true);

  ~execution_timer();

  execution_timer(const execution_timer&) = delete;
  execution_timer& operator = (const execution_timer&) = delete;

  /** Print accumulated totals via info() */
  static void
  report_global_stats();

  /** Total time accumulated under \p name */
  static std::chrono::nanoseconds
  total_duration(std::string_view name);

  void
  start();

  void
  stop();

  template <typename Duration>
  Duration
  elapsed() const
  { return std::chrono::duration_cast<Duration>(m_total_duration); }

  private:
  std::string m_name;
  bool m_running;
  std::chrono::time_point<std::chrono::steady_clock> m_start_time;
  std::chrono::nanoseconds m_total_duration;
}; // class kon::execution_timer

} // namespace kon
