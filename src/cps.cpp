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


#include "kontra/cps.hpp"
#include "kontra/atomicity.hpp"
#include "kontra/builtin_wrapper.hpp"
#include "kontra/logging.hpp"
#include "kontra/term_utils.hpp"
#include "kontra/utilities/execution_timer.hpp"


void
kon::cps_pipeline::_reserve_identifiers(term t) const
{
  for (const std::string &name : identifiers(t))
    m_gensym.reserve(name);
}


kon::term
kon::cps_pipeline::_convert(term t) const
{
  execution_timer lifttimer {"lift applications"};
  const term lifted = m_lifter(t);
  lifttimer.stop();
  debug("after lifting applications:\n{}", lifted);

  execution_timer cpstimer {"CPS conversion"};
  const term result =
      is_atomic(lifted)
          ? m_transformer.cps_atomic(lifted)
          : m_transformer.cps_complex(identity_continuation(m_gensym), lifted);
  cpstimer.stop();
  debug("after CPS conversion ({} -> {} nodes):\n{}", term_size(t),
        term_size(result), result);

  return result;
}


kon::term
kon::cps_pipeline::lift(term t) const
{
  _reserve_identifiers(t);
  return m_lifter(t);
}


kon::term
kon::cps_pipeline::operator () (term t) const
{
  KON_FUNCTION_BENCHMARK

  _reserve_identifiers(t);
  return _convert(t);
}


kon::definition_vector
kon::cps_pipeline::transform_builtins(const definition_vector &builtins) const
{
  KON_FUNCTION_BENCHMARK

  // Names of all definitions must be known before the first one is converted
  for (const definition &def : builtins)
  {
    m_gensym.reserve(def.name);
    _reserve_identifiers(def.value);
  }

  definition_vector result;
  result.reserve(builtins.size());
  for (const definition &def : builtins)
  {
    debug("CPS conversion of builtin {}", def.name);
    kon::indent _;
    result.push_back({def.name, _convert(def.value)});
  }
  return result;
}
