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

#include <algorithm>
#include <format>
#include <sstream>

/**
 * \file format.hpp
 * std::format support for terms and patterns
 *
 * Format specification `{:#N}` limits the printed nesting depth to N.
 *
 * \ingroup utils
 */


namespace std {

template <>
struct formatter<kon::term, char> {
  int maxdepth = -1;

  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it == '#')
    {
      it++;
      maxdepth = 0;
      while (it != ctx.end() and *it >= '0' and *it <= '9')
      {
        maxdepth *= 10;
        maxdepth += *it - '0';
        it++;
      }
    }
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for kon::term"};
    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(kon::term x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    kon::write(buffer, x, maxdepth);
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
}; // struct std::formatter<kon::term>


template <>
struct formatter<kon::pattern, char> {
  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  { return ctx.begin(); }

  template <class FmtContext>
  FmtContext::iterator
  format(kon::pattern x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    kon::write(buffer, x);
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
}; // struct std::formatter<kon::pattern>

} // namespace std
