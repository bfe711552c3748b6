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
#include "kontra/transformation.hpp"
#include "kontra/stl/vector.hpp"


namespace kon {

/**
 * Lift complex subterms out of non-tail positions
 *
 * Complex terms found in a condition, a match scrutinee, a projection base or
 * an element of an aggregate are replaced with fresh variables bound around
 * the node:
 * ```
 * (f x, g y)  ->  (fun _k1 -> (fun _k2 -> (_k1, _k2)) (g y)) (f x)
 * ```
 * Branches of conditionals and arms of matches stay in place, as do lambda
 * bodies and both sides of an application. Afterwards, only App, If and Match
 * nodes can be non-atomic, which is what the CPS transformation relies on.
 *
 * \ingroup cps
 */
class application_lifter {
  public:
  application_lifter(symbol_generator &gensym)
  : m_gensym {gensym}
  { }

  /**
   * Lift applications in a term
   *
   * \throws internal_error On closures and partially applied builtins
   */
  term
  operator () (term t) const;

  private:
  struct binding {
    std::string_view name;
    term value;
  };
  using binding_vector = stl::vector<binding>;

  term
  _extract(term child, binding_vector &bindings) const;

  static term
  _wrap(term t, const binding_vector &bindings);

  symbol_generator &m_gensym;
}; // class kon::application_lifter
static_assert(transformation<application_lifter>);

} // namespace kon
