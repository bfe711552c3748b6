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

#include "kontra/symbol_generator.hpp"
#include "kontra/term.hpp"


namespace kon {

/**
 * Conversion of lifted terms into continuation-passing style
 *
 * Every converted function takes its continuation as an extra leading
 * parameter and never returns: its body always ends in a call, eventually of
 * the continuation. Input must have been processed with application_lifter,
 * so that only App, If and Match nodes are complex.
 *
 * \ingroup cps
 */
class cps_transformer {
  public:
  cps_transformer(symbol_generator &gensym)
  : m_gensym {gensym}
  { }

  /**
   * Convert an atomic term into a CPS value
   *
   * \throws internal_error If \p t is not atomic, contains a closure or a
   *                        partially applied builtin
   */
  term
  cps_atomic(term t) const;

  /**
   * Convert a term so that its result is passed to \p cont
   *
   * \param cont Atomic term denoting a one-argument continuation
   * \param t Term to convert
   * \throws internal_error See cps_atomic()
   */
  term
  cps_complex(term cont, term t) const;

  private:
  /**
   * Convert If or Match with complex branches
   *
   * The continuation is bound once to a fresh variable which every branch
   * then refers to, so that it is not copied into each of them.
   */
  template <typename Rebuild>
  term
  _share_continuation(term cont, Rebuild rebuild) const;

  symbol_generator &m_gensym;
}; // class kon::cps_transformer

} // namespace kon
