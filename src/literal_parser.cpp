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


#include "recset/literal_parser.hpp"
#include "recset/sequence.hpp"
#include "recset/tuple.hpp"
#include "recset/set.hpp"
#include "recset/map.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <format>


using token = rcs::literal_parser::token;


static bool
_starts_number(std::string_view input, size_t i)
{
  const auto digit_at = [&](size_t j) {
    return j < input.size() and
           std::isdigit(static_cast<unsigned char>(input[j]));
  };
  const char c = input[i];
  if (digit_at(i))
    return true;
  if (c == '-' or c == '+')
  {
    return digit_at(i + 1) or
           (i + 1 < input.size() and input[i + 1] == '.' and digit_at(i + 2));
  }
  if (c == '.')
    return digit_at(i + 1);
  return false;
}


static int
_hex_digit(char c)
{
  if (c >= '0' and c <= '9')
    return c - '0';
  if (c >= 'a' and c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' and c <= 'F')
    return c - 'A' + 10;
  return -1;
}


static token
_read_string(std::string_view input, size_t &i)
{
  const size_t start = i++;
  std::string str;
  while (i < input.size() and input[i] != '"')
  {
    char c = input[i++];
    if (c == '\\')
    {
      if (i >= input.size())
        break;
      c = input[i++];
      switch (c)
      {
        case 'n': str += '\n'; break;
        case 't': str += '\t'; break;
        case 'r': str += '\r'; break;
        case 'x':
        {
          const int hi = i < input.size() ? _hex_digit(input[i]) : -1;
          const int lo = i + 1 < input.size() ? _hex_digit(input[i + 1]) : -1;
          if (hi < 0 or lo < 0)
          {
            if (i + 1 >= input.size())
            {
              throw rcs::incomplete_input {"Unterminated string literal",
                                           start};
            }
            throw rcs::parse_error {"Invalid \\x escape in string literal",
                                    i};
          }
          str += static_cast<char>(hi * 16 + lo);
          i += 2;
          break;
        }
        default: str += c; break;
      }
    }
    else
      str += c;
  }

  if (i >= input.size())
    throw rcs::incomplete_input {"Unterminated string literal", start};
  i++; // closing quote
  return {token::type::STRING, std::move(str), start, i};
}


static token
_read_number(std::string_view input, size_t &i)
{
  const size_t start = i;
  if (input[i] == '-' or input[i] == '+')
    i++;
  while (i < input.size())
  {
    const char c = input[i];
    if (std::isdigit(static_cast<unsigned char>(c)) or c == '.' or c == 'e' or
        c == 'E')
      i++;
    else if ((c == '-' or c == '+') and
             (input[i - 1] == 'e' or input[i - 1] == 'E'))
      i++;
    else
      break;
  }
  return {token::type::NUMBER, std::string {input.substr(start, i - start)},
          start, i};
}


std::vector<token>
rcs::literal_parser::tokenize(std::string_view input)
{
  std::vector<token> tokens;
  size_t i = 0;
  while (i < input.size())
  {
    const char c = input[i];

    if (std::isspace(static_cast<unsigned char>(c)))
    {
      i++;
      continue;
    }

    // Comments
    if (c == ';')
    {
      while (i < input.size() and input[i] != '\n')
        i++;
      continue;
    }

    enum token::type type;
    switch (c)
    {
      case '{': type = token::type::LBRACE; break;
      case '}': type = token::type::RBRACE; break;
      case '(': type = token::type::LPAREN; break;
      case ')': type = token::type::RPAREN; break;
      case '[': type = token::type::LBRACKET; break;
      case ']': type = token::type::RBRACKET; break;
      case ',': type = token::type::COMMA; break;

      case '=':
        if (i + 1 >= input.size())
          throw incomplete_input {"Unexpected end of input after '='", i};
        if (input[i + 1] != '>')
          throw parse_error {"Expected '=>'", i};
        tokens.push_back({token::type::ARROW, "=>", i, i + 2});
        i += 2;
        continue;

      case '"':
        tokens.push_back(_read_string(input, i));
        continue;

      default:
        if (_starts_number(input, i))
        {
          tokens.push_back(_read_number(input, i));
          continue;
        }
        throw parse_error {std::format("Unexpected character '{}'", c), i};
    }

    tokens.push_back({type, std::string(1, c), i, i + 1});
    i++;
  }

  return tokens;
}


static rcs::value
_parse_number(const token &tok)
{
  double x = 0;
  const char *first = tok.text.data();
  const char *last = first + tok.text.size();
  // from_chars does not take a leading plus
  if (first != last and *first == '+')
    first++;
  const auto [ptr, ec] = std::from_chars(first, last, x);
  if (ec != std::errc {} or ptr != last or not std::isfinite(x))
  {
    throw rcs::parse_error {
        std::format("Invalid number literal '{}'", tok.text), tok.start};
  }
  return rcs::num(x);
}


static const token&
_peek(const std::vector<token> &tokens, size_t pos, size_t end_offset)
{
  if (pos >= tokens.size())
    throw rcs::incomplete_input {"Unexpected end of input", end_offset};
  return tokens[pos];
}


static size_t
_end_offset(const std::vector<token> &tokens)
{ return tokens.empty() ? 0 : tokens.back().end; }


rcs::value
rcs::literal_parser::parse_tokens(const std::vector<token> &tokens,
                                  size_t &pos)
{
  const token &tok = _peek(tokens, pos, _end_offset(tokens));
  pos++;

  switch (tok.type)
  {
    case token::type::NUMBER:
      return _parse_number(tok);

    case token::type::STRING:
      return str(tok.text);

    case token::type::LPAREN:
      return _parse_elements(tokens, pos, token::type::RPAREN, tag::tuple);

    case token::type::LBRACKET:
      return _parse_elements(tokens, pos, token::type::RBRACKET, tag::seq);

    case token::type::LBRACE:
      return _parse_braces(tokens, pos);

    default:
      throw parse_error {std::format("Unexpected '{}'", tok.text), tok.start};
  }
}


rcs::value
rcs::literal_parser::_parse_elements(const std::vector<token> &tokens,
                                     size_t &pos, enum token::type close,
                                     tag kind)
{
  const size_t end = _end_offset(tokens);
  stl::vector<value> elements;
  if (_peek(tokens, pos, end).type == close)
    pos++;
  else
  {
    while (true)
    {
      elements.push_back(parse_tokens(tokens, pos));
      const token &sep = _peek(tokens, pos, end);
      pos++;
      if (sep.type == close)
        break;
      if (sep.type != token::type::COMMA)
      {
        throw parse_error {
            std::format("Expected ',' or closing bracket, got '{}'", sep.text),
            sep.start};
      }
    }
  }

  if (kind == tag::tuple)
    return tuple::from(elements);
  return sequence::from(elements);
}


rcs::value
rcs::literal_parser::_parse_braces(const std::vector<token> &tokens,
                                   size_t &pos)
{
  const size_t end = _end_offset(tokens);

  // {} and {=>}
  if (_peek(tokens, pos, end).type == token::type::RBRACE)
  {
    pos++;
    return set {};
  }
  if (_peek(tokens, pos, end).type == token::type::ARROW)
  {
    pos++;
    const token &close = _peek(tokens, pos, end);
    if (close.type != token::type::RBRACE)
      throw parse_error {"Expected '}' after '{=>'", close.start};
    pos++;
    return map {};
  }

  const value first = parse_tokens(tokens, pos);
  if (_peek(tokens, pos, end).type == token::type::ARROW)
  {
    // Map
    map ret;
    value key = first;
    while (true)
    {
      const token &arrow = _peek(tokens, pos, end);
      if (arrow.type != token::type::ARROW)
        throw parse_error {"Expected '=>'", arrow.start};
      pos++;
      ret.set(key, parse_tokens(tokens, pos));

      const token &sep = _peek(tokens, pos, end);
      pos++;
      if (sep.type == token::type::RBRACE)
        return ret;
      if (sep.type != token::type::COMMA)
        throw parse_error {"Expected ',' or '}' in map literal", sep.start};
      key = parse_tokens(tokens, pos);
    }
  }

  // Set
  set ret;
  ret.add(first);
  while (true)
  {
    const token &sep = _peek(tokens, pos, end);
    pos++;
    if (sep.type == token::type::RBRACE)
      return ret;
    if (sep.type != token::type::COMMA)
      throw parse_error {"Expected ',' or '}' in set literal", sep.start};
    ret.add(parse_tokens(tokens, pos));
  }
}


rcs::value
rcs::literal_parser::parse(std::string_view input)
{
  const std::vector<token> tokens = tokenize(input);
  size_t pos = 0;
  const value result = parse_tokens(tokens, pos);
  if (pos < tokens.size())
  {
    throw parse_error {std::format("Unexpected '{}' after value",
                                   tokens[pos].text),
                       tokens[pos].start};
  }
  return result;
}


rcs::stl::vector<rcs::value>
rcs::literal_parser::parse_all(std::string_view input)
{
  const std::vector<token> tokens = tokenize(input);
  size_t pos = 0;
  stl::vector<value> result;
  while (pos < tokens.size())
    result.push_back(parse_tokens(tokens, pos));
  return result;
}
