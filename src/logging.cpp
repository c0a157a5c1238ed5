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


#include "recset/logging.hpp"


size_t rcs::logging_indent = 0;

enum rcs::loglevel rcs::loglevel = rcs::loglevel::warning;


void
rcs::log_message(std::string_view header, const std::string &message)
{
  std::ostringstream buffer;
  std::istringstream input {message};
  std::string line;
  bool first = true;
  while (std::getline(input, line))
  {
    if (first)
    {
      buffer << "recset ";
      if (not header.empty())
        buffer << header << ' ';
      buffer << add_indent(logging_indent);
      first = false;
    }
    else
      buffer << "       " << add_indent(logging_indent + 1);
    buffer << line << '\n';
  }
  std::cerr << buffer.str();
}
