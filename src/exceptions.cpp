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


#include "kontra/exceptions.hpp"
#include "kontra/format.hpp"
#include "kontra/memory.hpp"

#include <new>


static std::shared_ptr<kon::node*>
_make_root(kon::term t)
{
  kon::node **root =
      static_cast<kon::node**>(GC_malloc_uncollectable(sizeof(kon::node*)));
  if (root == nullptr)
    throw std::bad_alloc {};
  *root = &*t;
  return std::shared_ptr<kon::node*> {root, [](kon::node **p) { GC_free(p); }};
}


kon::internal_error::internal_error(std::string_view what, term code)
: logic_error(std::string(what)), m_code {_make_root(code)}
{ }


void
kon::internal_error::display(std::ostream &os) const noexcept
{
  try
  {
    os << what() << "\n"
       << std::format("in {} node: {:#8}", tag_name(code()->t), code());
  }
  catch (const std::exception &exn)
  {
    // Don't let a failure to render the term hide the original message
    os << what() << " (" << exn.what() << ")";
  }
}
