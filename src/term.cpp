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

#include <cstring>
#include <format>
#include <stdexcept>
#include <string>


std::string_view
kon::tag_name(tag t) noexcept
{
  switch (t)
  {
    case tag::var: return "Var";
    case tag::lam: return "Lam";
    case tag::app: return "App";
    case tag::ite: return "If";
    case tag::match: return "Match";
    case tag::rec: return "Rec";
    case tag::rec_proj: return "RecProj";
    case tag::tup: return "Tup";
    case tag::tup_proj: return "TupProj";
    case tag::list: return "List";
    case tag::constant: return "Const";
    case tag::fix: return "Fix";
    case tag::concat: return "Concat";
    case tag::infer: return "Infer";
    case tag::logpdf: return "LogPdf";
    case tag::utest: return "Utest";
    case tag::sample: return "Sample";
    case tag::weight: return "Weight";
    case tag::dweight: return "DWeight";
    case tag::closure: return "Closure";
  }
  std::terminate();
}


kon::name_ref
kon::intern(std::string_view name)
{
  char *data = static_cast<char*>(allocate_atomic(name.length() + 1));
  std::memcpy(data, name.data(), name.length());
  data[name.length()] = '\0';
  return {data, name.length()};
}


static inline kon::node*
_opt(const std::optional<kon::term> &t) noexcept
{ return t ? &**t : nullptr; }


static inline std::optional<kon::term>
_opt(kon::node *ptr) noexcept
{
  if (ptr == nullptr)
    return std::nullopt;
  return kon::term {ptr};
}


////////////////////////////////////////////////////////////////////////////////
//
//                              Constructors
//
kon::term
kon::var(std::string_view name)
{
  term ret {make<node>(tag::var)};
  ret->var = intern(name);
  return ret;
}


kon::term
kon::lam(std::string_view param, term body)
{
  term ret {make<node>(tag::lam)};
  ret->lam.param = intern(param);
  ret->lam.body = &*body;
  return ret;
}


kon::term
kon::app(term fn, term arg)
{
  term ret {make<node>(tag::app)};
  ret->app.fn = &*fn;
  ret->app.arg = &*arg;
  return ret;
}


kon::term
kon::ite(term cond, term then_branch, term else_branch)
{
  term ret {make<node>(tag::ite)};
  ret->ite.cond = &*cond;
  ret->ite.then_branch = &*then_branch;
  ret->ite.else_branch = &*else_branch;
  return ret;
}


kon::term
kon::match(term scrutinee, arm_vector arms)
{
  term ret {make<node>(tag::match)};
  ret->match.scrutinee = &*scrutinee;
  ret->match.arms = make<arm_vector>(std::move(arms));
  return ret;
}


kon::term
kon::rec(field_vector fields)
{
  // Labels must outlive the caller's buffers
  for (field &f : fields)
    f.label = intern(f.label).view();

  term ret {make<node>(tag::rec)};
  ret->rec.fields = make<field_vector>(std::move(fields));
  return ret;
}


kon::term
kon::rec_proj(term base, std::string_view label)
{
  term ret {make<node>(tag::rec_proj)};
  ret->rec_proj.base = &*base;
  ret->rec_proj.label = intern(label);
  return ret;
}


kon::term
kon::tup(term_vector elements)
{
  term ret {make<node>(tag::tup)};
  ret->seq.elements = make<term_vector>(std::move(elements));
  return ret;
}


kon::term
kon::tup_proj(term base, size_t index)
{
  term ret {make<node>(tag::tup_proj)};
  ret->tup_proj.base = &*base;
  ret->tup_proj.index = index;
  return ret;
}


kon::term
kon::list(term_vector elements)
{
  term ret {make<node>(tag::list)};
  ret->seq.elements = make<term_vector>(std::move(elements));
  return ret;
}


static kon::term
_constant(kon::constant_kind kind, size_t arity)
{
  kon::term ret {kon::make<kon::node>(kon::tag::constant)};
  ret->constant.kind = kind;
  ret->constant.arity = arity;
  ret->constant.boolean = false;
  ret->constant.number = 0;
  ret->constant.name = {"", 0};
  return ret;
}


kon::term
kon::unit()
{ return _constant(constant_kind::unit, 0); }


kon::term
kon::boolean(bool value)
{
  term ret = _constant(constant_kind::boolean, 0);
  ret->constant.boolean = value;
  return ret;
}


kon::term
kon::number(long double value)
{
  term ret = _constant(constant_kind::number, 0);
  ret->constant.number = value;
  return ret;
}


kon::term
kon::primitive(std::string_view name, size_t arity)
{
  term ret = _constant(constant_kind::primitive, arity);
  ret->constant.name = intern(name);
  return ret;
}


kon::term
kon::fix()
{ return term {make<node>(tag::fix)}; }


static kon::term
_builtin(kon::tag tag, const std::optional<kon::term> &operand)
{
  kon::term ret {kon::make<kon::node>(tag)};
  ret->builtin.operand = _opt(operand);
  return ret;
}


kon::term
kon::concat(std::optional<term> operand)
{ return _builtin(tag::concat, operand); }


kon::term
kon::infer(std::optional<term> operand)
{ return _builtin(tag::infer, operand); }


kon::term
kon::logpdf(std::optional<term> operand)
{ return _builtin(tag::logpdf, operand); }


kon::term
kon::utest(std::optional<term> operand)
{ return _builtin(tag::utest, operand); }


static kon::term
_prob(kon::tag tag, const std::optional<kon::term> &first,
      const std::optional<kon::term> &second)
{
  kon::term ret {kon::make<kon::node>(tag)};
  ret->prob.first = _opt(first);
  ret->prob.second = _opt(second);
  return ret;
}


kon::term
kon::sample(std::optional<term> first, std::optional<term> second)
{ return _prob(tag::sample, first, second); }


kon::term
kon::weight(std::optional<term> first, std::optional<term> second)
{ return _prob(tag::weight, first, second); }


kon::term
kon::dweight(std::optional<term> first, std::optional<term> second)
{ return _prob(tag::dweight, first, second); }


kon::term
kon::closure(std::string_view param, term body, void *env)
{
  term ret {make<node>(tag::closure)};
  ret->closure.param = intern(param);
  ret->closure.body = &*body;
  ret->closure.env = env;
  return ret;
}


kon::pattern
kon::pat::wildcard()
{ return pattern {make<pattern_node>(pattern_tag::wildcard)}; }


kon::pattern
kon::pat::variable(std::string_view name)
{
  pattern ret {make<pattern_node>(pattern_tag::variable)};
  ret->variable = intern(name);
  return ret;
}


kon::pattern
kon::pat::literal(term constant)
{
  if (constant->t != tag::constant or
      constant->constant.kind == constant_kind::primitive)
    throw std::invalid_argument {"pat::literal() - not a literal constant"};

  pattern ret {make<pattern_node>(pattern_tag::literal)};
  ret->literal = &*constant;
  return ret;
}


kon::pattern
kon::pat::tuple(pattern_vector elements)
{
  pattern ret {make<pattern_node>(pattern_tag::tuple)};
  ret->elements = make<pattern_vector>(std::move(elements));
  return ret;
}


kon::pattern
kon::pat::cons(pattern head, pattern tail)
{
  pattern ret {make<pattern_node>(pattern_tag::cons)};
  ret->cons.head = &*head;
  ret->cons.tail = &*tail;
  return ret;
}


kon::pattern
kon::pat::nil()
{ return pattern {make<pattern_node>(pattern_tag::nil)}; }


////////////////////////////////////////////////////////////////////////////////
//
//                                Accessors
//
static inline void
_expect(kon::term t, kon::tag expected, const char *who)
{
  if (t->t != expected)
  {
    throw std::invalid_argument {
        std::format("{}() - not a {} (got {})", who, kon::tag_name(expected),
                    kon::tag_name(t->t))};
  }
}


static inline void
_expect(kon::pattern p, kon::pattern_tag expected, const char *who)
{
  if (p->t != expected)
    throw std::invalid_argument {std::format("{}() - wrong pattern", who)};
}


std::string_view
kon::var_name(term t)
{ _expect(t, tag::var, __func__); return t->var.view(); }

std::string_view
kon::lam_param(term t)
{ _expect(t, tag::lam, __func__); return t->lam.param.view(); }

kon::term
kon::lam_body(term t)
{ _expect(t, tag::lam, __func__); return term {t->lam.body}; }

kon::term
kon::app_fn(term t)
{ _expect(t, tag::app, __func__); return term {t->app.fn}; }

kon::term
kon::app_arg(term t)
{ _expect(t, tag::app, __func__); return term {t->app.arg}; }

kon::term
kon::if_cond(term t)
{ _expect(t, tag::ite, __func__); return term {t->ite.cond}; }

kon::term
kon::if_then(term t)
{ _expect(t, tag::ite, __func__); return term {t->ite.then_branch}; }

kon::term
kon::if_else(term t)
{ _expect(t, tag::ite, __func__); return term {t->ite.else_branch}; }

kon::term
kon::match_scrutinee(term t)
{ _expect(t, tag::match, __func__); return term {t->match.scrutinee}; }

const kon::arm_vector&
kon::match_arms(term t)
{ _expect(t, tag::match, __func__); return *t->match.arms; }

const kon::field_vector&
kon::rec_fields(term t)
{ _expect(t, tag::rec, __func__); return *t->rec.fields; }


kon::term
kon::proj_base(term t)
{
  if (t->t == tag::rec_proj)
    return term {t->rec_proj.base};
  _expect(t, tag::tup_proj, __func__);
  return term {t->tup_proj.base};
}


std::string_view
kon::rec_proj_label(term t)
{ _expect(t, tag::rec_proj, __func__); return t->rec_proj.label.view(); }

size_t
kon::tup_proj_index(term t)
{ _expect(t, tag::tup_proj, __func__); return t->tup_proj.index; }


const kon::term_vector&
kon::elements(term t)
{
  if (t->t == tag::list)
    return *t->seq.elements;
  _expect(t, tag::tup, __func__);
  return *t->seq.elements;
}


kon::constant_kind
kon::const_kind(term t)
{ _expect(t, tag::constant, __func__); return t->constant.kind; }

size_t
kon::arity(term t)
{ _expect(t, tag::constant, __func__); return t->constant.arity; }


bool
kon::bool_val(term t)
{
  _expect(t, tag::constant, __func__);
  if (t->constant.kind != constant_kind::boolean)
    throw std::invalid_argument {"bool_val() - not a boolean"};
  return t->constant.boolean;
}


long double
kon::num_val(term t)
{
  _expect(t, tag::constant, __func__);
  if (t->constant.kind != constant_kind::number)
    throw std::invalid_argument {"num_val() - not a number"};
  return t->constant.number;
}


std::string_view
kon::primitive_name(term t)
{
  _expect(t, tag::constant, __func__);
  if (t->constant.kind != constant_kind::primitive)
    throw std::invalid_argument {"primitive_name() - not a primitive"};
  return t->constant.name.view();
}


std::optional<kon::term>
kon::builtin_operand(term t)
{
  if (not isbuiltin(t))
    throw std::invalid_argument {"builtin_operand() - not a builtin"};
  return _opt(t->builtin.operand);
}


std::optional<kon::term>
kon::prob_first(term t)
{
  if (not isprob(t))
    throw std::invalid_argument {"prob_first() - not a probabilistic primitive"};
  return _opt(t->prob.first);
}


std::optional<kon::term>
kon::prob_second(term t)
{
  if (not isprob(t))
    throw std::invalid_argument {"prob_second() - not a probabilistic primitive"};
  return _opt(t->prob.second);
}


std::string_view
kon::closure_param(term t)
{ _expect(t, tag::closure, __func__); return t->closure.param.view(); }

kon::term
kon::closure_body(term t)
{ _expect(t, tag::closure, __func__); return term {t->closure.body}; }


std::string_view
kon::pattern_var_name(pattern p)
{ _expect(p, pattern_tag::variable, __func__); return p->variable.view(); }

kon::term
kon::pattern_literal(pattern p)
{ _expect(p, pattern_tag::literal, __func__); return term {p->literal}; }

const kon::pattern_vector&
kon::pattern_elements(pattern p)
{ _expect(p, pattern_tag::tuple, __func__); return *p->elements; }

kon::pattern
kon::pattern_head(pattern p)
{ _expect(p, pattern_tag::cons, __func__); return pattern {p->cons.head}; }

kon::pattern
kon::pattern_tail(pattern p)
{ _expect(p, pattern_tag::cons, __func__); return pattern {p->cons.tail}; }
