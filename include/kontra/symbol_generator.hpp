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

#include "kontra/term.hpp"

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>


namespace kon {

/**
 * Generator of fresh identifiers
 *
 * Identifiers are produced from a format string with a single `{}` which is
 * replaced by a counter. The counter is shared by reference, so several
 * generators (e.g. with different formats) can feed from one compilation-unit
 * counter. Reserved names are never produced; every produced name becomes
 * reserved itself.
 */
class symbol_generator {
  public:
  symbol_generator(size_t &counter, std::string_view format = "_k{}")
  : m_format {format}, m_counter {counter}
  { }

  symbol_generator(const symbol_generator&) = delete;
  symbol_generator& operator = (const symbol_generator&) = delete;

  std::string_view
  operator () ()
  { return operator () (m_format); }

  std::string_view
  operator () (std::string_view format)
  {
    if (format.find("{}") == std::string_view::npos)
      throw std::invalid_argument {"symbol_generator - format without {}"};

    std::string name;
    do
    {
      m_counter ++;
      name = std::vformat(format, std::make_format_args(m_counter));
    }
    while (m_reserved.contains(name));

    m_reserved.emplace(name);
    return intern(name).view();
  }

  /** Forbid generation of \p name */
  void
  reserve(std::string_view name)
  { m_reserved.emplace(name); }

  bool
  is_reserved(std::string_view name) const
  { return m_reserved.contains(std::string {name}); }

  size_t
  counter() const noexcept
  { return m_counter; }

  private:
  const std::string m_format;
  size_t &m_counter;
  std::unordered_set<std::string> m_reserved;
}; // class kon::symbol_generator

} // namespace kon
