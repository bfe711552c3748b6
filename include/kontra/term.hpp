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

#include "kontra/memory.hpp"
#include "kontra/stl/vector.hpp"

#include <cassert>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>

/**
 * \file term.hpp
 * Term model of the core language
 *
 * Terms form a closed tagged union. Nodes live on the garbage-collected heap
 * and are never modified after construction: every pass builds a new tree
 * (sharing untouched subtrees with its input).
 *
 * \ingroup core
 */


namespace kon {

/**
 * Tag enumeration for term nodes
 *
 * Every pass switches over this enumeration without a default label, so that
 * a new variant is reported by the compiler in each of them.
 *
 * \ingroup core
 */
enum class tag {
  var,
  lam,
  app,
  ite,
  match,
  rec,
  rec_proj,
  tup,
  tup_proj,
  list,
  constant,
  fix,
  concat,
  infer,
  logpdf,
  utest,
  sample,
  weight,
  dweight,
  closure,
};

/**
 * Kinds of constants
 *
 * Literals (unit, booleans and numbers) have arity zero; primitives are opaque
 * operations with a fixed number of arguments.
 *
 * \ingroup core
 */
enum class constant_kind {
  unit,
  boolean,
  number,
  primitive,
};

/**
 * Tag enumeration for patterns of match-arms
 *
 * \ingroup core
 */
enum class pattern_tag {
  wildcard,
  variable,
  literal,
  tuple,
  cons,
  nil,
};

std::string_view
tag_name(tag t) noexcept;

/**
 * Identifier stored inside of a node
 *
 * Characters are allocated with allocate_atomic() and are owned by the node.
 */
struct name_ref {
  const char *data;
  size_t len;

  std::string_view
  view() const noexcept
  { return {data, len}; }
}; // struct kon::name_ref

name_ref
intern(std::string_view name);

struct node;
struct pattern_node;


/**
 * Reference to a term node
 *
 * \ingroup core
 */
class term {
  public:
  explicit term(node *ptr): m_ptr {ptr} { assert(ptr != nullptr); }

  node*
  operator -> () const noexcept
  { return m_ptr; }

  node&
  operator * () const noexcept
  { return *m_ptr; }

  private:
  node *m_ptr;
}; // class kon::term


/**
 * Reference to a pattern node
 *
 * \ingroup core
 */
class pattern {
  public:
  explicit pattern(pattern_node *ptr): m_ptr {ptr} { assert(ptr != nullptr); }

  pattern_node*
  operator -> () const noexcept
  { return m_ptr; }

  pattern_node&
  operator * () const noexcept
  { return *m_ptr; }

  private:
  pattern_node *m_ptr;
}; // class kon::pattern


/** Arm of a match-expression */
struct arm {
  kon::pattern pattern;
  kon::term body;
}; // struct kon::arm

/** Labeled field of a record */
struct field {
  std::string_view label;
  kon::term value;
}; // struct kon::field

using term_vector = stl::vector<term>;
using arm_vector = stl::vector<arm>;
using field_vector = stl::vector<field>;
using pattern_vector = stl::vector<pattern>;


/**
 * Term node
 *
 * \note Fields of the union are accessed through the functions below which
 *       check the tag; direct access is reserved for the constructors.
 *
 * \ingroup core
 */
struct node {
  node(tag tag): t {tag} { }

  tag t; /**< Variant of the node */
  union {
    name_ref var;
    struct { name_ref param; node *body; } lam;
    struct { node *fn, *arg; } app;
    struct { node *cond, *then_branch, *else_branch; } ite;
    struct { node *scrutinee; const arm_vector *arms; } match;
    struct { const field_vector *fields; } rec;
    struct { node *base; name_ref label; } rec_proj;
    struct { const term_vector *elements; } seq; /**< Tuples and lists */
    struct { node *base; size_t index; } tup_proj;
    struct {
      constant_kind kind;
      size_t arity;
      bool boolean;
      long double number;
      name_ref name;
    } constant;
    struct { node *operand; } builtin; /**< nullptr if unapplied */
    struct { node *first, *second; } prob; /**< nullptr if unapplied */
    struct { name_ref param; node *body; void *env; } closure;
  };
}; // struct kon::node


/**
 * Pattern node
 *
 * \ingroup core
 */
struct pattern_node {
  pattern_node(pattern_tag tag): t {tag} { }

  pattern_tag t;
  union {
    name_ref variable;
    node *literal;
    const pattern_vector *elements;
    struct { pattern_node *head, *tail; } cons;
  };
}; // struct kon::pattern_node


/**
 * \name Term constructors
 * \{
 */

[[nodiscard]] term
var(std::string_view name);

[[nodiscard]] term
lam(std::string_view param, term body);

[[nodiscard]] term
app(term fn, term arg);

/**
 * Curried application of \p fn to several arguments
 *
 * `app(f, a, b)` is `app(app(f, a), b)`.
 */
template <typename ...Rest>
[[nodiscard]] term
app(term fn, term arg, term next, Rest ...rest)
{ return app(app(fn, arg), next, rest...); }

[[nodiscard]] term
ite(term cond, term then_branch, term else_branch);

[[nodiscard]] term
match(term scrutinee, arm_vector arms);

[[nodiscard]] term
rec(field_vector fields);

[[nodiscard]] term
rec_proj(term base, std::string_view label);

[[nodiscard]] term
tup(term_vector elements);

[[nodiscard]] term
tup_proj(term base, size_t index);

[[nodiscard]] term
list(term_vector elements);

[[nodiscard]] term
unit();

[[nodiscard]] term
boolean(bool value);

[[nodiscard]] term
number(long double value);

/**
 * Create an opaque primitive operation
 *
 * \param name Name of the operation (e.g. `add`)
 * \param arity Number of arguments the operation consumes
 */
[[nodiscard]] term
primitive(std::string_view name, size_t arity);

[[nodiscard]] term
fix();

[[nodiscard]] term
concat(std::optional<term> operand = std::nullopt);

[[nodiscard]] term
infer(std::optional<term> operand = std::nullopt);

[[nodiscard]] term
logpdf(std::optional<term> operand = std::nullopt);

[[nodiscard]] term
utest(std::optional<term> operand = std::nullopt);

[[nodiscard]] term
sample(std::optional<term> first = std::nullopt,
       std::optional<term> second = std::nullopt);

[[nodiscard]] term
weight(std::optional<term> first = std::nullopt,
       std::optional<term> second = std::nullopt);

[[nodiscard]] term
dweight(std::optional<term> first = std::nullopt,
        std::optional<term> second = std::nullopt);

[[nodiscard]] term
closure(std::string_view param, term body, void *env = nullptr);

/** \} */


/**
 * \name Pattern constructors
 * \{
 */
namespace pat {

[[nodiscard]] pattern
wildcard();

[[nodiscard]] pattern
variable(std::string_view name);

/**
 * Pattern matching a literal constant
 *
 * \throws std::invalid_argument If \p constant is not a literal constant
 */
[[nodiscard]] pattern
literal(term constant);

[[nodiscard]] pattern
tuple(pattern_vector elements);

[[nodiscard]] pattern
cons(pattern head, pattern tail);

[[nodiscard]] pattern
nil();

} // namespace kon::pat
/** \} */


/**
 * \name Term accessors
 *
 * All accessors throw std::invalid_argument when applied to a term of a
 * different variant.
 * \{
 */

[[nodiscard]] std::string_view
var_name(term t);

[[nodiscard]] std::string_view
lam_param(term t);

[[nodiscard]] term
lam_body(term t);

[[nodiscard]] term
app_fn(term t);

[[nodiscard]] term
app_arg(term t);

[[nodiscard]] term
if_cond(term t);

[[nodiscard]] term
if_then(term t);

[[nodiscard]] term
if_else(term t);

[[nodiscard]] term
match_scrutinee(term t);

[[nodiscard]] const arm_vector&
match_arms(term t);

[[nodiscard]] const field_vector&
rec_fields(term t);

/** Base of a record- or tuple-projection */
[[nodiscard]] term
proj_base(term t);

[[nodiscard]] std::string_view
rec_proj_label(term t);

[[nodiscard]] size_t
tup_proj_index(term t);

/** Elements of a tuple or a list */
[[nodiscard]] const term_vector&
elements(term t);

[[nodiscard]] constant_kind
const_kind(term t);

/**
 * Number of arguments consumed by a constant
 *
 * \throws std::invalid_argument If \p t is not a constant
 */
[[nodiscard]] size_t
arity(term t);

[[nodiscard]] bool
bool_val(term t);

[[nodiscard]] long double
num_val(term t);

[[nodiscard]] std::string_view
primitive_name(term t);

/** Operand of Concat, Infer, LogPdf or Utest */
[[nodiscard]] std::optional<term>
builtin_operand(term t);

/** First argument of Sample, Weight or DWeight */
[[nodiscard]] std::optional<term>
prob_first(term t);

/** Second argument of Sample, Weight or DWeight */
[[nodiscard]] std::optional<term>
prob_second(term t);

[[nodiscard]] std::string_view
closure_param(term t);

[[nodiscard]] term
closure_body(term t);

/** \} */


/**
 * \name Pattern accessors
 * \{
 */

[[nodiscard]] std::string_view
pattern_var_name(pattern p);

[[nodiscard]] term
pattern_literal(pattern p);

[[nodiscard]] const pattern_vector&
pattern_elements(pattern p);

[[nodiscard]] pattern
pattern_head(pattern p);

[[nodiscard]] pattern
pattern_tail(pattern p);

/** \} */


/**
 * \name Type tests
 * \{
 */

[[nodiscard]] inline bool
is(term a, term b) noexcept
{ return &*a == &*b; }

[[nodiscard]] inline bool
isvar(term t) noexcept
{ return t->t == tag::var; }

[[nodiscard]] inline bool
isvar(term t, std::string_view name) noexcept
{ return isvar(t) and t->var.view() == name; }

[[nodiscard]] inline bool
islam(term t) noexcept
{ return t->t == tag::lam; }

[[nodiscard]] inline bool
isapp(term t) noexcept
{ return t->t == tag::app; }

/** Check if \p t is one of Concat, Infer, LogPdf or Utest */
[[nodiscard]] inline bool
isbuiltin(term t) noexcept
{
  switch (t->t)
  {
    case tag::concat:
    case tag::infer:
    case tag::logpdf:
    case tag::utest:
      return true;
    default:
      return false;
  }
}

/** Check if \p t is one of Sample, Weight or DWeight */
[[nodiscard]] inline bool
isprob(term t) noexcept
{ return t->t == tag::sample or t->t == tag::weight or t->t == tag::dweight; }

/**
 * Check if a builtin or a probabilistic primitive is in its unapplied shape
 *
 * Always true for other variants.
 */
[[nodiscard]] inline bool
is_canonical(term t) noexcept
{
  if (isbuiltin(t))
    return t->builtin.operand == nullptr;
  if (isprob(t))
    return t->prob.first == nullptr and t->prob.second == nullptr;
  return true;
}

/** \} */


/**
 * \name Printing
 * \{
 */

/**
 * Write term in ML-like concrete syntax
 *
 * \param maxdepth Nesting depth after which subterms are elided (`...`); a
 *                 negative value disables elision
 *
 * \ingroup core
 */
void
write(std::ostream &os, term t, int maxdepth = -1);

void
write(std::ostream &os, pattern p);

inline std::ostream&
operator << (std::ostream &os, term t)
{ write(os, t); return os; }

inline std::ostream&
operator << (std::ostream &os, pattern p)
{ write(os, p); return os; }

/** \} */

} // namespace kon
