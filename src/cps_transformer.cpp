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


#include "kontra/cps_transformer.hpp"
#include "kontra/atomicity.hpp"
#include "kontra/builtin_wrapper.hpp"
#include "kontra/exceptions.hpp"

#include <exception>
#include <optional>


kon::term
kon::cps_transformer::cps_atomic(term t) const
{
  switch (t->t)
  {
    case tag::var:
      return t;

    case tag::lam: {
      const std::string_view k = m_gensym();
      return lam(k, lam(lam_param(t), cps_complex(var(k), lam_body(t))));
    }

    case tag::app:
      throw internal_error {"complex term in cps_atomic", t};

    case tag::closure:
      throw internal_error {"closure in cps_atomic", t};

    case tag::match: {
      arm_vector arms;
      arms.reserve(match_arms(t).size());
      for (const arm &a : match_arms(t))
        arms.push_back({a.pattern, cps_atomic(a.body)});
      return match(cps_atomic(match_scrutinee(t)), std::move(arms));
    }

    case tag::ite:
      return ite(cps_atomic(if_cond(t)), cps_atomic(if_then(t)),
                 cps_atomic(if_else(t)));

    case tag::tup: {
      term_vector newelements;
      newelements.reserve(elements(t).size());
      for (const term x : elements(t))
        newelements.push_back(cps_atomic(x));
      return tup(std::move(newelements));
    }

    case tag::tup_proj:
      return tup_proj(cps_atomic(proj_base(t)), tup_proj_index(t));

    case tag::rec: {
      field_vector fields;
      fields.reserve(rec_fields(t).size());
      for (const field &f : rec_fields(t))
        fields.push_back({f.label, cps_atomic(f.value)});
      return rec(std::move(fields));
    }

    case tag::rec_proj:
      return rec_proj(cps_atomic(proj_base(t)), rec_proj_label(t));

    case tag::list: {
      term_vector newelements;
      newelements.reserve(elements(t).size());
      for (const term x : elements(t))
        newelements.push_back(cps_atomic(x));
      return list(std::move(newelements));
    }

    case tag::constant:
      return wrap_constant(t, m_gensym);

    case tag::fix:
      return wrap_fix(t, m_gensym);

    case tag::concat:
    case tag::infer:
    case tag::logpdf:
    case tag::utest:
      require_canonical(t);
      return wrap_builtin(t, builtin_arity(t), m_gensym);

    // Already in CPS form
    case tag::sample:
    case tag::weight:
    case tag::dweight:
      require_canonical(t);
      return t;
  }
  std::terminate();
}


template <typename Rebuild>
kon::term
kon::cps_transformer::_share_continuation(term cont, Rebuild rebuild) const
{
  const std::string_view c = m_gensym();
  const term inner = rebuild(var(c));
  return app(lam(c, inner), cont);
}


kon::term
kon::cps_transformer::cps_complex(term cont, term t) const
{
  switch (t->t)
  {
    case tag::app: {
      // Operator is evaluated before the operand; complex parts are computed
      // first and passed on through continuations binding fresh variables
      const term fn = app_fn(t);
      const term arg = app_arg(t);

      std::optional<std::string_view> fname, argname;
      if (not is_atomic(fn))
        fname = m_gensym();
      if (not is_atomic(arg))
        argname = m_gensym();

      const term newfn = fname ? var(*fname) : cps_atomic(fn);
      const term newarg = argname ? var(*argname) : cps_atomic(arg);

      term result = app(app(newfn, cont), newarg);
      if (argname)
        result = cps_complex(lam(*argname, result), arg);
      if (fname)
        result = cps_complex(lam(*fname, result), fn);
      return result;
    }

    case tag::match:
      if (is_atomic(t))
        return app(cont, cps_atomic(t));
      return _share_continuation(cont, [&](term c) {
        arm_vector arms;
        arms.reserve(match_arms(t).size());
        for (const arm &a : match_arms(t))
          arms.push_back({a.pattern, cps_complex(c, a.body)});
        return match(cps_atomic(match_scrutinee(t)), std::move(arms));
      });

    case tag::ite:
      if (is_atomic(t))
        return app(cont, cps_atomic(t));
      return _share_continuation(cont, [&](term c) {
        const term then_branch = cps_complex(c, if_then(t));
        const term else_branch = cps_complex(c, if_else(t));
        return ite(cps_atomic(if_cond(t)), then_branch, else_branch);
      });

    // After lifting, everything else is atomic
    case tag::tup:
    case tag::tup_proj:
    case tag::rec:
    case tag::rec_proj:
    case tag::list:
    case tag::var:
    case tag::lam:
    case tag::closure:
    case tag::constant:
    case tag::fix:
    case tag::concat:
    case tag::infer:
    case tag::logpdf:
    case tag::utest:
    case tag::sample:
    case tag::weight:
    case tag::dweight:
      return app(cont, cps_atomic(t));
  }
  std::terminate();
}
