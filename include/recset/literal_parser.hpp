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

#include "recset/value.hpp"
#include "recset/stl/vector.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file literal_parser.hpp
 * Parser of the written form of values
 *
 * Grammar:
 *
 *   value := number | string
 *          | '(' [value {',' value}] ')'            tuple
 *          | '[' [value {',' value}] ']'            sequence
 *          | '{' [value {',' value}] '}'            set
 *          | '{' value '=>' value {',' value '=>' value} '}'   map
 *          | '{' '=>' '}'                          empty map
 *
 * A `;` starts a comment running to the end of the line.
 *
 * \ingroup literals
 */


namespace rcs {

/**
 * Malformed literal
 *
 * \ingroup literals
 */
struct parse_error: public std::runtime_error {
  parse_error(const std::string &what, size_t offset)
  : runtime_error {what}, m_offset {offset}
  { }

  /** Byte offset of the offending input */
  size_t
  offset() const noexcept
  { return m_offset; }

  private:
  size_t m_offset;
}; // struct rcs::parse_error


/**
 * Input ended in the middle of a literal
 *
 * \ingroup literals
 */
struct incomplete_input: public parse_error {
  using parse_error::parse_error;
}; // struct rcs::incomplete_input


/**
 * Parser for value literals
 *
 * Parsed containers are mutable.
 *
 * \ingroup literals
 */
class literal_parser {
  public:
  struct token {
    enum class type {
      LBRACE,   // {
      RBRACE,   // }
      LPAREN,   // (
      RPAREN,   // )
      LBRACKET, // [
      RBRACKET, // ]
      COMMA,    // ,
      ARROW,    // =>
      STRING,   // "hello"
      NUMBER,   // 123, -4.5e6
    };
    type type;
    std::string text; /**< Unescaped contents for strings */
    size_t start;
    size_t end;
  }; // struct rcs::literal_parser::token

  /**
   * Parse exactly one value
   *
   * \throws incomplete_input If the input ends before the value does
   * \throws parse_error On malformed input or trailing tokens
   */
  value
  parse(std::string_view input);

  /**
   * Parse a whitespace separated series of values
   */
  stl::vector<value>
  parse_all(std::string_view input);

  /**
   * Split input into tokens
   *
   * \throws incomplete_input On an unterminated string
   * \throws parse_error On an unexpected character or a malformed number
   */
  std::vector<token>
  tokenize(std::string_view input);

  /**
   * Parse a value starting at token \p pos, advancing \p pos past it
   */
  value
  parse_tokens(const std::vector<token> &tokens, size_t &pos);

  private:
  value
  _parse_elements(const std::vector<token> &tokens, size_t &pos,
                  enum token::type close, tag kind);

  value
  _parse_braces(const std::vector<token> &tokens, size_t &pos);
}; // class rcs::literal_parser

} // namespace rcs
