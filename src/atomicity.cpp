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


#include "kontra/atomicity.hpp"

#include <algorithm>
#include <exception>


bool
kon::is_atomic(term t) noexcept
{
  switch (t->t)
  {
    case tag::app:
      return false;

    case tag::var:
    case tag::lam:
    case tag::closure:
    case tag::constant:
    case tag::fix:
    case tag::utest:
    case tag::concat:
    case tag::infer:
    case tag::logpdf:
    case tag::sample:
    case tag::weight:
    case tag::dweight:
      return true;

    case tag::ite:
      return is_atomic(term {t->ite.cond}) and
             is_atomic(term {t->ite.then_branch}) and
             is_atomic(term {t->ite.else_branch});

    case tag::match:
      return is_atomic(term {t->match.scrutinee}) and
             std::ranges::all_of(*t->match.arms,
                                 [](const arm &a) { return is_atomic(a.body); });

    case tag::rec:
      return std::ranges::all_of(
          *t->rec.fields, [](const field &f) { return is_atomic(f.value); });

    case tag::rec_proj:
      return is_atomic(term {t->rec_proj.base});

    case tag::tup_proj:
      return is_atomic(term {t->tup_proj.base});

    case tag::tup:
    case tag::list:
      return std::ranges::all_of(*t->seq.elements, is_atomic);
  }
  std::terminate();
}
