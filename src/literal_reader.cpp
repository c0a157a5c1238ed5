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


#include "recset/literal_reader.hpp"


rcs::literal_reader::literal_reader(literal_parser &parser)
: m_parser {parser}
{ }


void
rcs::literal_reader::operator << (const std::string &input)
{
  m_buffer += input;

  std::vector<literal_parser::token> tokens;
  try { tokens = m_parser.tokenize(m_buffer); }
  catch (const incomplete_input &) // Unterminated string
  { return; }
  catch (const parse_error &)
  {
    m_buffer.clear();
    throw;
  }

  // Parse all available values from the accumulated tokens
  size_t cursor = 0;
  size_t consumed = 0;
  while (cursor < tokens.size())
  {
    size_t pos = cursor;
    try { m_values.push_back(m_parser.parse_tokens(tokens, pos)); }
    catch (const incomplete_input &) // Not enough tokens to produce a value
    { break; }
    catch (const parse_error &)
    {
      m_buffer.clear();
      throw;
    }
    cursor = pos;
    consumed = tokens[pos - 1].end;
  }

  // Erase consumed text
  m_buffer.erase(0, consumed);
}


bool
rcs::literal_reader::operator >> (std::optional<value> &result)
{
  if (m_values.empty())
    return false;
  result = m_values.front();
  m_values.pop_front();
  return true;
}


bool
rcs::literal_reader::pending() const
{
  try { return not m_parser.tokenize(m_buffer).empty(); }
  catch (const incomplete_input &)
  { return true; }
}
