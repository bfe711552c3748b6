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


#include "kontra/builtin_wrapper.hpp"
#include "kontra/exceptions.hpp"

#include <stdexcept>


kon::term
kon::identity_continuation(symbol_generator &gensym)
{
  const std::string_view x = gensym();
  return lam(x, var(x));
}


size_t
kon::builtin_arity(term t)
{
  switch (t->t)
  {
    case tag::infer:
      return 1;

    case tag::concat:
    case tag::logpdf:
    case tag::utest:
      return 2;

    default:
      throw std::invalid_argument {"builtin_arity() - not a builtin"};
  }
}


kon::term
kon::wrap_builtin(term t, size_t arity, symbol_generator &gensym)
{
  stl::vector<std::string_view> args;
  args.reserve(arity);
  for (size_t i = 0; i < arity; ++i)
    args.push_back(gensym());

  // op v1 ... vn
  term acc = t;
  for (const std::string_view v : args)
    acc = app(acc, var(v));

  for (auto it = args.rbegin(); it != args.rend(); ++it)
  {
    const std::string_view k = gensym();
    acc = lam(k, lam(*it, app(var(k), acc)));
  }
  return acc;
}


kon::term
kon::wrap_constant(term t, symbol_generator &gensym)
{
  if (t->t != tag::constant)
    throw internal_error {"wrap_constant() of non-constant", t};
  return wrap_builtin(t, arity(t), gensym);
}


kon::term
kon::wrap_fix(term t, symbol_generator &gensym)
{
  const std::string_view v = gensym();
  const std::string_view k = gensym();
  const term inner = app(t, app(var(v), identity_continuation(gensym)));
  return lam(k, lam(v, app(var(k), inner)));
}
