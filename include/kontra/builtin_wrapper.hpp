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

#include <cstddef>


namespace kon {

/**
 * Identity continuation `fun x -> x` with a fresh parameter
 *
 * \ingroup cps
 */
[[nodiscard]] term
identity_continuation(symbol_generator &gensym);

/**
 * Number of arguments consumed by Concat, Infer, LogPdf or Utest
 *
 * \throws std::invalid_argument If \p t is not one of these builtins
 *
 * \ingroup cps
 */
[[nodiscard]] size_t
builtin_arity(term t);

/**
 * Wrap an opaque operation into curried CPS functions
 *
 * For an operation `op` of arity 2 the result is
 * ```
 * fun k1 -> fun v1 -> k1 (fun k2 -> fun v2 -> k2 (op v1 v2))
 * ```
 * Each stage takes a continuation and one argument; arguments are bound in
 * their original left-to-right order. The innermost body is the direct
 * application of the operation. A nullary operation is returned as is.
 *
 * \ingroup cps
 */
[[nodiscard]] term
wrap_builtin(term t, size_t arity, symbol_generator &gensym);

/**
 * Wrap a constant by its arity
 *
 * \throws internal_error If \p t is not a constant
 *
 * \ingroup cps
 */
[[nodiscard]] term
wrap_constant(term t, symbol_generator &gensym);

/**
 * Adapt the fixpoint combinator to the CPS calling convention
 *
 * Result: `fun k -> fun v -> k (fix (v id))`. The argument `v` is a converted
 * function which expects a continuation before the self-reference; it is
 * given the identity continuation so that `fix` receives a direct-style
 * generator of the recursive function.
 *
 * \ingroup cps
 */
[[nodiscard]] term
wrap_fix(term t, symbol_generator &gensym);

} // namespace kon
