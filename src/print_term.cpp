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


#include "kontra/term.hpp"

#include <format>


static void
_write_constant(std::ostream &os, kon::term t)
{
  using namespace kon;

  switch (const_kind(t))
  {
    case constant_kind::unit:
      os << "()";
      break;

    case constant_kind::boolean:
      os << (bool_val(t) ? "true" : "false");
      break;

    case constant_kind::number:
      os << std::format("{}", static_cast<double>(num_val(t)));
      break;

    case constant_kind::primitive:
      os << primitive_name(t);
      break;
  }
}


static void
_write(std::ostream &os, kon::term t, int maxdepth, int depth)
{
  using namespace kon;

  if (maxdepth >= 0 and depth > maxdepth)
  {
    os << "...";
    return;
  }

  const auto sub = [&](term x) { _write(os, x, maxdepth, depth + 1); };

  switch (t->t)
  {
    case tag::var:
      os << var_name(t);
      break;

    case tag::lam:
      os << "(fun " << lam_param(t) << " -> ";
      sub(lam_body(t));
      os << ")";
      break;

    case tag::app: {
      // Print curried application as a single spine
      stl::vector<term> args;
      term fn = t;
      for (; isapp(fn); fn = app_fn(fn))
        args.push_back(app_arg(fn));
      os << "(";
      sub(fn);
      for (auto it = args.rbegin(); it != args.rend(); ++it)
      {
        os << " ";
        sub(*it);
      }
      os << ")";
      break;
    }

    case tag::ite:
      os << "(if ";
      sub(if_cond(t));
      os << " then ";
      sub(if_then(t));
      os << " else ";
      sub(if_else(t));
      os << ")";
      break;

    case tag::match: {
      os << "(match ";
      sub(match_scrutinee(t));
      os << " with";
      bool first = true;
      for (const arm &a : match_arms(t))
      {
        os << (first ? " " : " | ") << a.pattern << " -> ";
        sub(a.body);
        first = false;
      }
      os << ")";
      break;
    }

    case tag::rec: {
      os << "{";
      bool first = true;
      for (const field &f : rec_fields(t))
      {
        os << (first ? "" : "; ") << f.label << " = ";
        sub(f.value);
        first = false;
      }
      os << "}";
      break;
    }

    case tag::rec_proj:
      sub(proj_base(t));
      os << "." << rec_proj_label(t);
      break;

    case tag::tup: {
      os << "(";
      bool first = true;
      for (const term x : elements(t))
      {
        os << (first ? "" : ", ");
        sub(x);
        first = false;
      }
      os << (elements(t).size() == 1 ? ",)" : ")");
      break;
    }

    case tag::tup_proj:
      sub(proj_base(t));
      os << "." << tup_proj_index(t);
      break;

    case tag::list: {
      os << "[";
      bool first = true;
      for (const term x : elements(t))
      {
        os << (first ? "" : "; ");
        sub(x);
        first = false;
      }
      os << "]";
      break;
    }

    case tag::constant:
      _write_constant(os, t);
      break;

    case tag::fix:
      os << "fix";
      break;

    case tag::concat:
    case tag::infer:
    case tag::logpdf:
    case tag::utest: {
      const std::optional<term> operand = builtin_operand(t);
      if (operand)
      {
        os << "(" << tag_name(t->t) << " ";
        sub(*operand);
        os << ")";
      }
      else
        os << tag_name(t->t);
      break;
    }

    case tag::sample:
    case tag::weight:
    case tag::dweight: {
      const std::optional<term> first = prob_first(t);
      const std::optional<term> second = prob_second(t);
      if (not first and not second)
      {
        os << tag_name(t->t);
        break;
      }
      os << "(" << tag_name(t->t);
      for (const std::optional<term> &x : {first, second})
      {
        os << " ";
        if (x)
          sub(*x);
        else
          os << "_";
      }
      os << ")";
      break;
    }

    case tag::closure:
      os << "<closure " << closure_param(t) << ">";
      break;
  }
}


void
kon::write(std::ostream &os, term t, int maxdepth)
{ _write(os, t, maxdepth, 0); }


void
kon::write(std::ostream &os, pattern p)
{
  switch (p->t)
  {
    case pattern_tag::wildcard:
      os << "_";
      break;

    case pattern_tag::variable:
      os << pattern_var_name(p);
      break;

    case pattern_tag::literal:
      _write_constant(os, pattern_literal(p));
      break;

    case pattern_tag::tuple: {
      os << "(";
      bool first = true;
      for (const pattern x : pattern_elements(p))
      {
        os << (first ? "" : ", ") << x;
        first = false;
      }
      os << (pattern_elements(p).size() == 1 ? ",)" : ")");
      break;
    }

    case pattern_tag::cons:
      os << "(" << pattern_head(p) << " :: " << pattern_tail(p) << ")";
      break;

    case pattern_tag::nil:
      os << "[]";
      break;
  }
}
