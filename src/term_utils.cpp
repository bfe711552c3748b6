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


#include "kontra/term_utils.hpp"


void
kon::pattern_binders(pattern p, identifier_set &result)
{
  switch (p->t)
  {
    case pattern_tag::variable:
      result.emplace(pattern_var_name(p));
      break;

    case pattern_tag::tuple:
      for (const pattern x : pattern_elements(p))
        pattern_binders(x, result);
      break;

    case pattern_tag::cons:
      pattern_binders(pattern_head(p), result);
      pattern_binders(pattern_tail(p), result);
      break;

    case pattern_tag::wildcard:
    case pattern_tag::literal:
    case pattern_tag::nil:
      break;
  }
}


// Generic traversal over direct subterms
template <typename Function>
static void
_for_each_child(kon::term t, Function f)
{
  using namespace kon;

  switch (t->t)
  {
    case tag::lam:
      f(lam_body(t));
      break;

    case tag::app:
      f(app_fn(t));
      f(app_arg(t));
      break;

    case tag::ite:
      f(if_cond(t));
      f(if_then(t));
      f(if_else(t));
      break;

    case tag::match:
      f(match_scrutinee(t));
      for (const arm &a : match_arms(t))
        f(a.body);
      break;

    case tag::rec:
      for (const field &x : rec_fields(t))
        f(x.value);
      break;

    case tag::rec_proj:
    case tag::tup_proj:
      f(proj_base(t));
      break;

    case tag::tup:
    case tag::list:
      for (const term x : elements(t))
        f(x);
      break;

    case tag::concat:
    case tag::infer:
    case tag::logpdf:
    case tag::utest:
      if (const std::optional<term> x = builtin_operand(t))
        f(*x);
      break;

    case tag::sample:
    case tag::weight:
    case tag::dweight:
      if (const std::optional<term> x = prob_first(t))
        f(*x);
      if (const std::optional<term> x = prob_second(t))
        f(*x);
      break;

    case tag::closure:
      f(closure_body(t));
      break;

    case tag::var:
    case tag::constant:
    case tag::fix:
      break;
  }
}


void
kon::for_each_child(term t, const std::function<void(term)> &f)
{ _for_each_child(t, [&](term x) { f(x); }); }


void
kon::collect_identifiers(term t, identifier_set &result)
{
  switch (t->t)
  {
    case tag::var:
      result.emplace(var_name(t));
      break;

    case tag::lam:
      result.emplace(lam_param(t));
      break;

    case tag::closure:
      result.emplace(closure_param(t));
      break;

    case tag::match:
      for (const arm &a : match_arms(t))
        pattern_binders(a.pattern, result);
      break;

    default:
      break;
  }

  _for_each_child(t, [&](term x) { collect_identifiers(x, result); });
}


static void
_free_variables(kon::term t, const kon::identifier_set &bound,
                kon::identifier_set &result)
{
  using namespace kon;

  switch (t->t)
  {
    case tag::var:
      if (not bound.contains(std::string {var_name(t)}))
        result.emplace(var_name(t));
      return;

    case tag::lam: {
      identifier_set newbound = bound;
      newbound.emplace(lam_param(t));
      _free_variables(lam_body(t), newbound, result);
      return;
    }

    case tag::closure: {
      identifier_set newbound = bound;
      newbound.emplace(closure_param(t));
      _free_variables(closure_body(t), newbound, result);
      return;
    }

    case tag::match: {
      _free_variables(match_scrutinee(t), bound, result);
      for (const arm &a : match_arms(t))
      {
        identifier_set newbound = bound;
        pattern_binders(a.pattern, newbound);
        _free_variables(a.body, newbound, result);
      }
      return;
    }

    default:
      _for_each_child(t, [&](term x) { _free_variables(x, bound, result); });
      return;
  }
}


kon::identifier_set
kon::free_variables(term t)
{
  identifier_set result;
  _free_variables(t, {}, result);
  return result;
}


size_t
kon::term_size(term t)
{
  size_t size = 1;
  _for_each_child(t, [&](term x) { size += term_size(x); });
  return size;
}
