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
#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>


namespace kon {

using identifier_set = std::unordered_set<std::string>;

/**
 * Administrative binding `(fun name -> body) value`
 */
[[nodiscard]] inline term
let(std::string_view name, term value, term body)
{ return app(lam(name, body), value); }

/**
 * Call \p f on each direct subterm of \p t, left to right
 *
 * Patterns are not visited.
 */
void
for_each_child(term t, const std::function<void(term)> &f);

/**
 * Collect names bound by a pattern
 */
void
pattern_binders(pattern p, identifier_set &result);

/**
 * Collect every identifier occurring in a term
 *
 * Includes variable references, lambda- and closure-parameters, and binders of
 * match patterns.
 */
void
collect_identifiers(term t, identifier_set &result);

[[nodiscard]] inline identifier_set
identifiers(term t)
{
  identifier_set result;
  collect_identifiers(t, result);
  return result;
}

/**
 * Collect variables referenced but not bound in a term
 */
[[nodiscard]] identifier_set
free_variables(term t);

/**
 * Count nodes of a term (patterns are not counted)
 */
[[nodiscard]] size_t
term_size(term t);

} // namespace kon
