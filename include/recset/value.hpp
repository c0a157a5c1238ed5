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

#include "recset/memory.hpp"

#include <cassert>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * \file value.hpp
 * Core value representation
 *
 * A value is a handle to an object of the closed value universe: numbers,
 * strings, and the four container kinds (sequence, tuple, set, map).
 * Containers may hold any value, including other containers.
 *
 * \ingroup core
 */


namespace rcs {

/**
 * Kind of an object
 *
 * Declaration order of the container kinds is their tie-breaking rank in
 * compare().
 *
 * \ingroup core
 */
enum class tag {
  num,
  str,
  seq,
  tuple,
  set,
  map,
};

/**
 * Human readable name of an object kind
 *
 * \ingroup core
 */
[[nodiscard]] std::string_view
tag_name(tag t) noexcept;

struct object;

namespace detail {
struct sequence_body;
struct set_body;
struct map_body;
} // namespace rcs::detail


/**
 * Handle referring to an object
 *
 * Copying a handle never copies the object: two handles may refer to the same
 * container. Independent containers are obtained with `mutable_copy()`.
 *
 * \ingroup core
 */
class value {
  public:
  /**
   * Constructor
   *
   * \param ptr Pointer to the object
   */
  explicit value(object *ptr): m_ptr {ptr} { assert(ptr != nullptr); }

  /**
   * \name Implicit construction of numbers and strings
   * \{
   */
  value(int x);
  value(long x);
  value(long long x);
  value(unsigned x);
  value(unsigned long x);
  value(unsigned long long x);
  value(double x);
  value(const char *x);
  value(std::string_view x);
  value(const std::string &x);
  /** \} */

  /**
   * Access the object via pointer syntax
   */
  constexpr object*
  operator -> () const noexcept
  { return m_ptr; }

  /**
   * Dereference the value
   */
  constexpr object&
  operator * () const noexcept
  { return *m_ptr; }

  /**
   * Structural equality (see rcs::equal())
   */
  [[nodiscard]] bool
  operator == (const value &other) const;

  private:
  object *m_ptr; /**< Pointer to the object */
}; // class rcs::value


/**
 * Object referred to by values
 *
 * Primitives are frozen from birth. A container is mutable until its hash is
 * computed; from then on `hash` is valid and the container never changes.
 *
 * \ingroup core
 */
struct object {
  /**
   * Constructor
   *
   * \note This constructor is unsafe; payload is left uninitialized
   * \param tag Kind of the object
   */
  object(tag tag): t {tag}, frozen {false}, hash {0} { }

  tag t;         /**< Kind */
  bool frozen;   /**< Set once the hash is computed */
  uint32_t hash; /**< Content hash, valid when frozen */
  union {
    double num;                                 /**< Number */
    struct { char *data; size_t len; } str;     /**< String bytes */
    struct { value *data; size_t len; } tup;    /**< Tuple elements */
    detail::sequence_body *seq;                 /**< Sequence storage */
    detail::set_body *set;                      /**< Set storage */
    detail::map_body *map;                      /**< Map storage */
  };
}; // struct rcs::object


/**
 * \name Hashing and lifecycle
 * \{
 */

/**
 * Hash a number
 *
 * Integral numbers fitting into 32 bits go through an avalanche mix, the rest
 * are hashed over their IEEE-754 representation.
 *
 * \ingroup hash
 */
[[nodiscard]] uint32_t
hash_number(double x) noexcept;

/**
 * FNV-1a hash of a byte string
 *
 * \ingroup hash
 */
[[nodiscard]] uint32_t
hash_string(std::string_view s) noexcept;

/**
 * Content hash of a value
 *
 * \warning Computing the hash of a container freezes it together with every
 * container nested inside it.
 *
 * \ingroup hash
 */
[[nodiscard]] uint32_t
hash(value x);

/**
 * Make a container immutable (computes and caches its hash)
 *
 * \ingroup hash
 */
void
freeze(value x);

/**
 * Check whether a value can no longer change
 *
 * \ingroup hash
 */
[[nodiscard]] inline bool
is_frozen(value x) noexcept
{ return x->frozen; }

/** \} */


/**
 * \name Fundamental constructors
 * \{
 */

/**
 * Create a numeric value
 *
 * \note Non-finite numbers can be created but are rejected by every
 * container.
 *
 * \ingroup core
 */
[[nodiscard]] inline value
num(double x)
{
  value ret {make_atomic<object>(tag::num)};
  ret->num = x;
  ret->hash = hash_number(x);
  ret->frozen = true;
  return ret;
}

/**
 * Create a string value
 *
 * \ingroup core
 */
[[nodiscard]] inline value
str(std::string_view s)
{
  value ret {make<object>(tag::str)};
  ret->str.data = static_cast<char*>(allocate_atomic(s.length() + 1));
  std::memcpy(ret->str.data, s.data(), s.length());
  ret->str.data[s.length()] = '\0';
  ret->str.len = s.length();
  ret->hash = hash_string(s);
  ret->frozen = true;
  return ret;
}

/** \} */


/**
 * \name Type tests
 * \{
 */

[[nodiscard]] inline bool
isnum(value x) noexcept
{ return x->t == tag::num; }

[[nodiscard]] inline bool
isstr(value x) noexcept
{ return x->t == tag::str; }

[[nodiscard]] inline bool
isseq(value x) noexcept
{ return x->t == tag::seq; }

[[nodiscard]] inline bool
istuple(value x) noexcept
{ return x->t == tag::tuple; }

[[nodiscard]] inline bool
isset(value x) noexcept
{ return x->t == tag::set; }

[[nodiscard]] inline bool
ismap(value x) noexcept
{ return x->t == tag::map; }

/**
 * Check if a value is a container (sequence, tuple, set or map)
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
iscontainer(value x) noexcept
{ return x->t >= tag::seq; }

/**
 * Get the number
 *
 * \throws std::invalid_argument If the value is not a number
 *
 * \ingroup core
 */
[[nodiscard]] inline double
num_val(value x)
{
  if (not isnum(x))
    throw std::invalid_argument {"num_val() - not a number"};
  return x->num;
}

/**
 * Get the string
 *
 * \return View of the string bytes (valid as long as the value is reachable)
 * \throws std::invalid_argument If the value is not a string
 *
 * \ingroup core
 */
[[nodiscard]] inline std::string_view
str_view(value x)
{
  if (not isstr(x))
    throw std::invalid_argument {"str_view() - not a string"};
  return std::string_view {x->str.data, x->str.len};
}

/**
 * Check if a number may be stored in a container
 *
 * \ingroup core
 */
[[nodiscard]] bool
is_storable(value x) noexcept;

/** \} */


/**
 * \name Basic functions
 * \{
 */

/**
 * Check if two values refer to the same object
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
is(value a, value b) noexcept
{ return &*a == &*b; }

/**
 * Structural equality
 *
 * Containers are equal iff they are of the same kind and hold equal contents;
 * construction order and object identity are irrelevant.
 *
 * \note Containers are frozen as a side effect (their hashes are compared).
 *
 * \ingroup core
 */
[[nodiscard]] bool
equal(value a, value b);

/**
 * Total order over all storable values
 *
 * Numbers precede strings which precede containers. Containers are ordered by
 * hash, then by kind, then by deep comparison of their contents.
 *
 * \return Negative, zero, or positive
 *
 * \ingroup core
 */
[[nodiscard]] int
compare(value a, value b);

/**
 * Strict weak ordering over compare()
 *
 * \ingroup core
 */
struct less {
  bool
  operator () (const value &a, const value &b) const
  { return compare(a, b) < 0; }
}; // struct rcs::less

/** \} */


/**
 * \name Printing
 * \{
 */

/**
 * Write value in a format that can be parsed back
 *
 * \ingroup core
 */
void
write(std::ostream &os, value x);

/**
 * Write value in a human appealing format (strings are not quoted)
 *
 * \ingroup core
 */
void
display(std::ostream &os, value x);

/**
 * Get the written representation as a string
 *
 * \ingroup core
 */
[[nodiscard]] std::string
to_string(value x);

/** \} */

} // namespace rcs


/**
 * Output a value to a stream (written format)
 *
 * \ingroup core
 */
inline std::ostream&
operator << (std::ostream &os, const rcs::value &x)
{ rcs::write(os, x); return os; }

inline rcs::value::value(int x): value {num(x)} { }
inline rcs::value::value(long x): value {num(double(x))} { }
inline rcs::value::value(long long x): value {num(double(x))} { }
inline rcs::value::value(unsigned x): value {num(x)} { }
inline rcs::value::value(unsigned long x): value {num(double(x))} { }
inline rcs::value::value(unsigned long long x): value {num(double(x))} { }
inline rcs::value::value(double x): value {num(x)} { }
inline rcs::value::value(const char *x): value {str(x)} { }
inline rcs::value::value(std::string_view x): value {str(x)} { }
inline rcs::value::value(const std::string &x): value {str(x)} { }

inline bool
rcs::value::operator == (const rcs::value &other) const
{ return rcs::equal(*this, other); }
