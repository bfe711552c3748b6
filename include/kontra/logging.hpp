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

#include "kontra/format.hpp" // IWYU pragma: export

#include <cstddef>
#include <format>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>


namespace kon {

enum class loglevel: int {
  silent,
  error,
  warning,
  info,
  debug,
};

inline std::string_view
loglevel_name(loglevel lvl)
{
  switch (lvl)
  {
    case loglevel::silent: return "silent";
    case loglevel::error: return "error";
    case loglevel::warning: return "warning";
    case loglevel::info: return "info";
    case loglevel::debug: return "debug";
  }
  std::terminate();
}

inline loglevel
parse_loglevel(std::string_view name)
{
  for (loglevel lvl : {loglevel::silent, loglevel::error, loglevel::warning,
                       loglevel::info, loglevel::debug})
  {
    if (name == loglevel_name(lvl))
      return lvl;
  }
  throw std::runtime_error {std::format("Invalid loglevel name ({})", name)};
}


inline bool
operator >= (loglevel a, loglevel b)
{ return static_cast<int>(a) >= static_cast<int>(b); }


extern size_t logging_indent;

extern loglevel loglevel;


/**
 * Strip ANSI escape sequences from a string
 */
inline std::string
strip_escape_sequences(const std::string &input)
{
  static const std::regex escape_seq_regex("\\\e\\[[^m]*m");
  return std::regex_replace(input, escape_seq_regex, "");
}


/**
 * Prefix every line of a message with the current indentation
 *
 * Lines longer than \p max_length (if non-zero) are truncated.
 */
[[nodiscard]] inline std::string
indent_lines(size_t indent, const std::string &string, size_t max_length = 0)
{
  std::istringstream input {string};
  std::ostringstream output;
  std::string line;
  bool first = true;
  while (std::getline(input, line))
  {
    if (not first)
    {
      for (size_t i = 0; i < indent; ++i)
        output << "\e[2m¦\e[0m ";
    }
    first = false;

#ifndef KONTRA_RELEASE_BUILD
    if (max_length > 0)
    {
      std::string stripped = strip_escape_sequences(line);
      if (stripped.length() > max_length)
      {
        stripped.erase(max_length - 1);
        output << stripped << "…\n";
        continue;
      }
    }
#endif
    output << line << "\n";
  }
  return output.str();
}


namespace detail {

template <typename... Args> void
log(std::string_view label, std::format_string<Args...> fmt, Args &&...args)
{
  const std::string message = std::format(fmt, std::forward<Args>(args)...);
  std::cerr << "kontra " << label << " ";
  for (size_t i = 0; i < logging_indent; ++i)
    std::cerr << "\e[2m¦\e[0m ";
  std::cerr << indent_lines(logging_indent + 1, message, 150);
}

} // namespace kon::detail


template <typename... Args> void
debug([[maybe_unused]] std::format_string<Args...> fmt,
      [[maybe_unused]] Args &&...args)
{
#ifndef KONTRA_RELEASE_BUILD
  if (loglevel >= loglevel::debug)
    detail::log("\e[7;1mdebug\e[0m", fmt, std::forward<Args>(args)...);
#endif
}


template <typename... Args> void
info(std::format_string<Args...> fmt, Args &&...args)
{
  if (loglevel >= loglevel::info)
    detail::log("info", fmt, std::forward<Args>(args)...);
}


template <typename... Args> void
warning(std::format_string<Args...> fmt, Args &&...args)
{
  if (loglevel >= loglevel::warning)
    detail::log("\e[38;5;3;1mwarning\e[0m", fmt, std::forward<Args>(args)...);
}


template <typename... Args> void
error(std::format_string<Args...> fmt, Args &&...args)
{
  if (loglevel >= loglevel::error)
    detail::log("\e[38;5;1;1merror\e[0m", fmt, std::forward<Args>(args)...);
}


/**
 * Increase indentation of log messages for the lifetime of the object
 */
struct indent {
  indent(size_t inc = 1)
  : m_inc {inc}
  { logging_indent += m_inc; }

  ~indent()
  { logging_indent -= m_inc; }

  indent(const indent&) = delete;
  void operator = (const indent&) = delete;

  private:
  size_t m_inc;
}; // struct kon::indent

} // namespace kon
