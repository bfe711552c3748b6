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

#include <format>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>


namespace kon {

/**
 * Violation of an invariant of the compiler itself
 *
 * Raised when a pass receives a term that an earlier pass (or the caller)
 * must never have produced: a closure before evaluation, a partially applied
 * builtin, a complex term in an atomic position. It is not meant to be
 * handled; it describes a bug.
 *
 * \ingroup core
 */
struct internal_error: std::logic_error {
  internal_error(std::string_view what, term code);

  /** Offending term */
  term
  code() const noexcept
  { return term {*m_code}; }

  void
  display(std::ostream &os) const noexcept;

  std::string
  display() const
  {
    std::ostringstream buf;
    display(buf);
    return buf.str();
  }

  private:
  // Exception objects live outside of the collected heap, so the term is held
  // through an uncollectable root shared by all copies of the exception
  std::shared_ptr<node*> m_code;
}; // struct kon::internal_error


/**
 * Require a builtin or a probabilistic primitive to be in its unapplied shape
 *
 * \throws internal_error If \p t is partially applied
 */
inline void
require_canonical(term t)
{
  if (not is_canonical(t))
  {
    throw internal_error {
        std::format("partially applied {} should not exist before evaluation",
                    tag_name(t->t)),
        t};
  }
}

} // namespace kon
