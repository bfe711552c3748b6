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


#include "tail_form.hpp"

#include "kontra/format.hpp"
#include "kontra/term_utils.hpp"

#include <format>


static bool
_is_identity(kon::term t)
{ return kon::islam(t) and kon::isvar(kon::lam_body(t), kon::lam_param(t)); }


static bool
_in_tail_form(kon::term body)
{
  using namespace kon;

  switch (body->t)
  {
    case tag::app:
    case tag::lam:
      return true;

    case tag::ite:
      return _in_tail_form(if_then(body)) and _in_tail_form(if_else(body));

    case tag::match:
      for (const arm &a : match_arms(body))
      {
        if (not _in_tail_form(a.body))
          return false;
      }
      return true;

    default:
      return false;
  }
}


static void
_collect_violations(kon::term t, std::vector<std::string> &result)
{
  if (kon::islam(t) and not _is_identity(t) and
      not _in_tail_form(kon::lam_body(t)))
    result.push_back(std::format("{:#4}", t));

  kon::for_each_child(t, [&](kon::term x) { _collect_violations(x, result); });
}


std::vector<std::string>
kon::test::tail_form_violations(term t)
{
  std::vector<std::string> result;
  _collect_violations(t, result);
  return result;
}


size_t
kon::test::count_identities(term t)
{
  size_t n = _is_identity(t) ? 1 : 0;
  for_each_child(t, [&](term x) { n += count_identities(x); });
  return n;
}
