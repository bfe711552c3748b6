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


#include "kontra/equality.hpp"
#include "kontra/utilities/execution_timer.hpp"

#include <exception>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>


namespace {

// Pairs of identifiers bound at the same position in both terms; innermost
// binding is at the back
using _renaming = std::vector<std::pair<std::string_view, std::string_view>>;

struct _comparator {
  // Compare bound identifiers by position instead of by name
  bool alpha;
  _renaming renaming;

  bool
  same_binding(std::string_view a, std::string_view b) const
  {
    if (not alpha)
      return a == b;

    for (auto it = renaming.rbegin(); it != renaming.rend(); ++it)
    {
      const bool hita = it->first == a;
      const bool hitb = it->second == b;
      if (hita or hitb)
        return hita and hitb;
    }
    // Both are free
    return a == b;
  }

  bool
  optional_terms(std::optional<kon::term> a, std::optional<kon::term> b)
  {
    if (a.has_value() != b.has_value())
      return false;
    return not a.has_value() or terms(*a, *b);
  }

  bool
  patterns(kon::pattern a, kon::pattern b)
  {
    if (a->t != b->t)
      return false;

    switch (a->t)
    {
      case kon::pattern_tag::wildcard:
      case kon::pattern_tag::nil:
        return true;

      case kon::pattern_tag::variable:
        if (alpha)
        {
          renaming.emplace_back(kon::pattern_var_name(a),
                                kon::pattern_var_name(b));
          return true;
        }
        return kon::pattern_var_name(a) == kon::pattern_var_name(b);

      case kon::pattern_tag::literal:
        return terms(kon::pattern_literal(a), kon::pattern_literal(b));

      case kon::pattern_tag::tuple: {
        const kon::pattern_vector &xs = kon::pattern_elements(a);
        const kon::pattern_vector &ys = kon::pattern_elements(b);
        if (xs.size() != ys.size())
          return false;
        for (size_t i = 0; i < xs.size(); ++i)
        {
          if (not patterns(xs[i], ys[i]))
            return false;
        }
        return true;
      }

      case kon::pattern_tag::cons:
        return patterns(kon::pattern_head(a), kon::pattern_head(b)) and
               patterns(kon::pattern_tail(a), kon::pattern_tail(b));
    }
    std::terminate();
  }

  bool
  binder(std::string_view a, kon::term bodya, std::string_view b,
         kon::term bodyb)
  {
    if (not alpha)
      return a == b and terms(bodya, bodyb);

    renaming.emplace_back(a, b);
    const bool result = terms(bodya, bodyb);
    renaming.pop_back();
    return result;
  }

  bool
  sequences(const kon::term_vector &xs, const kon::term_vector &ys)
  {
    if (xs.size() != ys.size())
      return false;
    for (size_t i = 0; i < xs.size(); ++i)
    {
      if (not terms(xs[i], ys[i]))
        return false;
    }
    return true;
  }

  bool
  terms(kon::term a, kon::term b)
  {
    if (kon::is(a, b) and renaming.empty())
      return true;

    if (a->t != b->t)
      return false;

    switch (a->t)
    {
      case kon::tag::var:
        return same_binding(kon::var_name(a), kon::var_name(b));

      case kon::tag::lam:
        return binder(kon::lam_param(a), kon::lam_body(a), kon::lam_param(b),
                      kon::lam_body(b));

      case kon::tag::closure:
        return binder(kon::closure_param(a), kon::closure_body(a),
                      kon::closure_param(b), kon::closure_body(b));

      case kon::tag::app:
        return terms(kon::app_fn(a), kon::app_fn(b)) and
               terms(kon::app_arg(a), kon::app_arg(b));

      case kon::tag::ite:
        return terms(kon::if_cond(a), kon::if_cond(b)) and
               terms(kon::if_then(a), kon::if_then(b)) and
               terms(kon::if_else(a), kon::if_else(b));

      case kon::tag::match: {
        if (not terms(kon::match_scrutinee(a), kon::match_scrutinee(b)))
          return false;
        const kon::arm_vector &xs = kon::match_arms(a);
        const kon::arm_vector &ys = kon::match_arms(b);
        if (xs.size() != ys.size())
          return false;
        for (size_t i = 0; i < xs.size(); ++i)
        {
          const size_t mark = renaming.size();
          const bool ok = patterns(xs[i].pattern, ys[i].pattern) and
                          terms(xs[i].body, ys[i].body);
          renaming.resize(mark);
          if (not ok)
            return false;
        }
        return true;
      }

      case kon::tag::rec: {
        const kon::field_vector &xs = kon::rec_fields(a);
        const kon::field_vector &ys = kon::rec_fields(b);
        if (xs.size() != ys.size())
          return false;
        for (size_t i = 0; i < xs.size(); ++i)
        {
          if (xs[i].label != ys[i].label or
              not terms(xs[i].value, ys[i].value))
            return false;
        }
        return true;
      }

      case kon::tag::rec_proj:
        return kon::rec_proj_label(a) == kon::rec_proj_label(b) and
               terms(kon::proj_base(a), kon::proj_base(b));

      case kon::tag::tup_proj:
        return kon::tup_proj_index(a) == kon::tup_proj_index(b) and
               terms(kon::proj_base(a), kon::proj_base(b));

      case kon::tag::tup:
      case kon::tag::list:
        return sequences(kon::elements(a), kon::elements(b));

      case kon::tag::constant:
        if (kon::const_kind(a) != kon::const_kind(b))
          return false;
        switch (kon::const_kind(a))
        {
          case kon::constant_kind::unit:
            return true;
          case kon::constant_kind::boolean:
            return kon::bool_val(a) == kon::bool_val(b);
          case kon::constant_kind::number:
            return kon::num_val(a) == kon::num_val(b);
          case kon::constant_kind::primitive:
            return kon::primitive_name(a) == kon::primitive_name(b) and
                   kon::arity(a) == kon::arity(b);
        }
        std::terminate();

      case kon::tag::fix:
        return true;

      case kon::tag::concat:
      case kon::tag::infer:
      case kon::tag::logpdf:
      case kon::tag::utest:
        return optional_terms(kon::builtin_operand(a),
                              kon::builtin_operand(b));

      case kon::tag::sample:
      case kon::tag::weight:
      case kon::tag::dweight:
        return optional_terms(kon::prob_first(a), kon::prob_first(b)) and
               optional_terms(kon::prob_second(a), kon::prob_second(b));
    }
    std::terminate();
  }
}; // struct _comparator

} // anonymous namespace


bool
kon::equal(term a, term b)
{
  _comparator cmp {false, {}};
  return cmp.terms(a, b);
}


bool
kon::alpha_equal(term a, term b)
{
  KON_FUNCTION_BENCHMARK

  _comparator cmp {true, {}};
  return cmp.terms(a, b);
}
