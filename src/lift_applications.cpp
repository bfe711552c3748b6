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


#include "kontra/lift_applications.hpp"
#include "kontra/atomicity.hpp"
#include "kontra/exceptions.hpp"
#include "kontra/term_utils.hpp"

#include <exception>


kon::term
kon::application_lifter::_extract(term child, binding_vector &bindings) const
{
  const term newchild = (*this)(child);
  if (is_atomic(newchild))
    return newchild;

  const std::string_view name = m_gensym();
  bindings.push_back({name, newchild});
  return var(name);
}


kon::term
kon::application_lifter::_wrap(term t, const binding_vector &bindings)
{
  // First extracted subterm is evaluated first, i.e. bound outermost
  for (auto it = bindings.rbegin(); it != bindings.rend(); ++it)
    t = let(it->name, it->value, t);
  return t;
}


kon::term
kon::application_lifter::operator () (term t) const
{
  binding_vector bindings;

  switch (t->t)
  {
    case tag::ite: {
      const term cond = _extract(if_cond(t), bindings);
      const term newite = ite(cond, (*this)(if_then(t)), (*this)(if_else(t)));
      return _wrap(newite, bindings);
    }

    case tag::match: {
      const term scrutinee = _extract(match_scrutinee(t), bindings);
      arm_vector arms;
      arms.reserve(match_arms(t).size());
      for (const arm &a : match_arms(t))
        arms.push_back({a.pattern, (*this)(a.body)});
      return _wrap(match(scrutinee, std::move(arms)), bindings);
    }

    case tag::rec: {
      field_vector fields;
      fields.reserve(rec_fields(t).size());
      for (const field &f : rec_fields(t))
        fields.push_back({f.label, _extract(f.value, bindings)});
      return _wrap(rec(std::move(fields)), bindings);
    }

    case tag::rec_proj: {
      const term base = _extract(proj_base(t), bindings);
      return _wrap(rec_proj(base, rec_proj_label(t)), bindings);
    }

    case tag::tup: {
      term_vector newelements;
      newelements.reserve(elements(t).size());
      for (const term x : elements(t))
        newelements.push_back(_extract(x, bindings));
      return _wrap(tup(std::move(newelements)), bindings);
    }

    case tag::tup_proj: {
      const term base = _extract(proj_base(t), bindings);
      return _wrap(tup_proj(base, tup_proj_index(t)), bindings);
    }

    case tag::list: {
      term_vector newelements;
      newelements.reserve(elements(t).size());
      for (const term x : elements(t))
        newelements.push_back(_extract(x, bindings));
      return _wrap(list(std::move(newelements)), bindings);
    }

    case tag::lam:
      return lam(lam_param(t), (*this)(lam_body(t)));

    case tag::app:
      return app((*this)(app_fn(t)), (*this)(app_arg(t)));

    case tag::var:
    case tag::constant:
    case tag::fix:
      return t;

    case tag::concat:
    case tag::infer:
    case tag::logpdf:
    case tag::utest:
    case tag::sample:
    case tag::weight:
    case tag::dweight:
      require_canonical(t);
      return t;

    case tag::closure:
      throw internal_error {"closure should not exist before evaluation", t};
  }
  std::terminate();
}
