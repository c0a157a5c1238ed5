/*
 * Recset - Value-semantics recursive containers
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
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

/**
 * \file memory.hpp
 * Memory management for value objects and container storage
 *
 * Every object reachable through a value handle, together with the dense
 * arrays and index tables of the containers, lives in memory owned by the
 * Boehm GC collector. Handles are plain pointers and may be copied freely.
 *
 * \ingroup memory
 */

namespace rcs {

/**
 * Create a garbage-collected object
 *
 * \tparam T Type of the object
 * \param args Constructor arguments
 * \return Pointer to the new object
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make(Args&& ...args)
{
  void *mem = GC_malloc(sizeof(T));
  if (mem == nullptr)
    throw std::bad_alloc {};
  return new (mem) T {std::forward<Args>(args)...};
}

/**
 * Create a garbage-collected object which holds no pointers to other
 * collected memory (numbers, hash arrays)
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make_atomic(Args&& ...args)
{
  void *mem = GC_malloc_atomic(sizeof(T));
  if (mem == nullptr)
    throw std::bad_alloc {};
  return new (mem) T {std::forward<Args>(args)...};
}

/**
 * Allocate garbage-collected memory
 *
 * \param size Size in bytes
 * \return Pointer to zero-initialized memory
 *
 * \ingroup memory
 */
inline void*
allocate(size_t size)
{
  void *mem = GC_malloc(size);
  if (mem == nullptr and size > 0)
    throw std::bad_alloc {};
  return mem;
}

/**
 * Allocate garbage-collected memory that is never scanned for pointers
 *
 * \ingroup memory
 */
inline void*
allocate_atomic(size_t size)
{
  void *mem = GC_malloc_atomic(size);
  if (mem == nullptr and size > 0)
    throw std::bad_alloc {};
  return mem;
}

/**
 * Copy a range into a fresh garbage-collected array
 *
 * \param first Beginning of the source range
 * \param n Number of elements to copy
 * \return Pointer to the copy (nullptr for an empty range)
 *
 * \ingroup memory
 */
template <typename T>
  requires std::is_trivially_copyable_v<T>
T*
copy_array(const T *first, size_t n)
{
  if (n == 0)
    return nullptr;
  T *data = static_cast<T*>(allocate(n * sizeof(T)));
  std::uninitialized_copy_n(first, n, data);
  return data;
}


/**
 * Raw allocation function used by gc_allocator_base
 *
 * \ingroup memory
 */
template <typename T>
concept raw_allocator = requires(T a)
{
  { a(size_t{}) } -> std::convertible_to<void*>;
};

/**
 * STL allocator on top of the collector
 *
 * \tparam T Value type
 * \tparam RawAllocator Function object performing the actual allocation
 *
 * \ingroup memory
 */
template <typename T, raw_allocator RawAllocator>
struct gc_allocator_base {
  using pointer = T*;
  using const_pointer = const T*;
  using value_type = T;
  using size_type = size_t;
  using difference_type = ptrdiff_t;

  template <typename U>
  struct rebind {
    using other = gc_allocator_base<U, RawAllocator>;
  };

  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  gc_allocator_base(const RawAllocator &rawalloc = RawAllocator { })
  : m_rawalloc {rawalloc}
  { }

  template <typename U>
  gc_allocator_base(const gc_allocator_base<U, RawAllocator> &other)
  : m_rawalloc {other.raw_allocator()}
  { }

  const RawAllocator&
  raw_allocator() const noexcept
  { return m_rawalloc; }

  pointer
  allocate(size_type n)
  { return static_cast<T*>(m_rawalloc(n * sizeof(T))); }

  void
  deallocate(pointer p, [[maybe_unused]] size_type n)
  { GC_free(p); }

  bool
  operator == (const gc_allocator_base &) const noexcept
  { return true; }

  bool
  operator != (const gc_allocator_base &) const noexcept
  { return false; }

  private:
  RawAllocator m_rawalloc;
}; // struct rcs::gc_allocator_base

namespace detail {
struct allocate_wrapper {
  void* operator () (size_t nb) const { return rcs::allocate(nb); }
}; // struct rcs::detail::allocate_wrapper

struct allocate_atomic_wrapper {
  void* operator () (size_t nb) const { return rcs::allocate_atomic(nb); }
}; // struct rcs::detail::allocate_atomic_wrapper
} // namespace rcs::detail

template <typename T>
using gc_allocator = gc_allocator_base<T, detail::allocate_wrapper>;

template <typename T>
using atomic_gc_allocator = gc_allocator_base<T, detail::allocate_atomic_wrapper>;

} // namespace rcs
