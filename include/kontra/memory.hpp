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

#include <gc.h>

#include <concepts>
#include <cstddef>
#include <new>
#include <utility>
#include <type_traits>

/**
 * \file memory.hpp
 * Garbage-collected allocation for term nodes and their payloads
 *
 * Terms are never freed explicitly: nodes are allocated with the Boehm GC and
 * reclaimed once unreachable. Containers embedded into nodes must use
 * gc_allocator so that the collector can trace through their buffers.
 *
 * \ingroup memory
 */

namespace kon {

/**
 * Allocate and construct an object on the garbage-collected heap
 *
 * \note Destructor of the object is never called.
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make(Args&& ...args)
{
  T* obj = static_cast<T*>(GC_malloc(sizeof(T)));
  if (obj == nullptr)
    throw std::bad_alloc {};
  new (obj) T {std::forward<Args>(args)...};
  return obj;
}

/**
 * Allocate memory that is known not to contain pointers into the GC heap
 *
 * Used for character buffers of identifiers and labels.
 *
 * \ingroup memory
 */
inline void*
allocate_atomic(size_t size)
{
  void *ptr = GC_malloc_atomic(size);
  if (ptr == nullptr)
    throw std::bad_alloc {};
  return ptr;
}


template <typename T>
concept raw_allocator = requires(T a)
{
  { a(size_t{}) } -> std::convertible_to<void*>;
};

/**
 * STL-compatible allocator backed by the garbage collector
 *
 * \ingroup memory
 */
template <typename T, raw_allocator RawAllocator>
struct gc_allocator_base {
  using value_type = T;
  using size_type = size_t;
  using difference_type = ptrdiff_t;
  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  template <typename U>
  struct rebind {
    using other = gc_allocator_base<U, RawAllocator>;
  };

  gc_allocator_base() = default;

  template <typename U>
  gc_allocator_base(const gc_allocator_base<U, RawAllocator> &) noexcept
  { }

  T*
  allocate(size_type n)
  {
    void *ptr = RawAllocator {}(n * sizeof(T));
    if (ptr == nullptr)
      throw std::bad_alloc {};
    return static_cast<T*>(ptr);
  }

  void
  deallocate(T *p, [[maybe_unused]] size_type n) noexcept
  { GC_free(p); }

  bool
  operator == (const gc_allocator_base &) const noexcept
  { return true; }
}; // struct kon::gc_allocator_base

namespace detail {
struct allocate_wrapper {
  void* operator () (size_t nb) const noexcept { return GC_malloc(nb); }
}; // struct kon::detail::allocate_wrapper
} // namespace kon::detail

template <typename T>
using gc_allocator = gc_allocator_base<T, detail::allocate_wrapper>;

} // namespace kon
