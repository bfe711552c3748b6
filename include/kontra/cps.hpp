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

#include "kontra/cps_transformer.hpp"
#include "kontra/lift_applications.hpp"
#include "kontra/symbol_generator.hpp"
#include "kontra/term.hpp"
#include "kontra/transformation.hpp"
#include "kontra/stl/vector.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

/**
 * \file cps.hpp
 * CPS conversion of whole programs
 *
 * Pipeline:
 * 1. term -> [application_lifter] -> lifted term
 * 2. lifted term -> [cps_transformer] -> CPS term
 *    - atomic terms are converted directly into values;
 *    - complex terms are converted with the identity continuation.
 */


namespace kon {

/** Named top-level definition, e.g. an entry of the builtin environment */
struct definition {
  std::string_view name;
  kon::term value;
}; // struct kon::definition

using definition_vector = stl::vector<definition>;


class cps_pipeline {
  public:
  /**
   * Use an external generator of fresh names
   *
   * Names generated for distinct terms of one compilation unit are then
   * distinct as well.
   */
  cps_pipeline(symbol_generator &gensym)
  : m_gensym {gensym},
    m_lifter {gensym},
    m_transformer {gensym}
  { }

  /** Use a private generator (and counter) */
  cps_pipeline()
  : m_default_counter {0},
    m_default_symbol_generator {std::in_place, *m_default_counter},
    m_gensym {*m_default_symbol_generator},
    m_lifter {m_gensym},
    m_transformer {m_gensym}
  { }

  cps_pipeline(const cps_pipeline&) = delete;
  cps_pipeline& operator = (const cps_pipeline&) = delete;

  /**
   * Run the lifting pass only
   */
  term
  lift(term t) const;

  /**
   * CPS-transform a program
   *
   * \throws internal_error If the term violates the input requirements
   */
  term
  operator () (term t) const;

  /**
   * CPS-transform the builtin environment of a program
   *
   * Definitions are converted in order, each as a separate program.
   */
  definition_vector
  transform_builtins(const definition_vector &builtins) const;

  private:
  void
  _reserve_identifiers(term t) const;

  term
  _convert(term t) const;

  std::optional<size_t> m_default_counter;
  std::optional<symbol_generator> m_default_symbol_generator;
  symbol_generator &m_gensym;
  application_lifter m_lifter;
  cps_transformer m_transformer;
}; // class kon::cps_pipeline
static_assert(transformation<cps_pipeline>);


/**
 * CPS-transform a program using a fresh counter of generated names
 */
[[nodiscard]] inline term
cps_transform(term t)
{ return cps_pipeline {}(t); }

} // namespace kon
