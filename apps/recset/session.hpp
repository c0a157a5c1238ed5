#pragma once

#include "recset/literal_parser.hpp"
#include "recset/literal_reader.hpp"
#include "recset/stl/vector.hpp"
#include "recset/value.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>


/**
 * Line-oriented command interpreter of the value inspector
 *
 * A command is a name followed by value literals. Literals may span several
 * lines; the command runs once all of them are complete.
 */
class session {
  public:
  session(std::ostream &out);

  /**
   * Feed one line of input
   *
   * Errors raised by the command are reported through the log and do not end
   * the session.
   *
   * \return Whether the current command waits for more lines
   */
  bool
  feed(const std::string &line);

  /**
   * Abandon a command waiting for more input
   *
   * \return Whether there was such a command
   */
  bool
  discard();

  static const std::vector<std::string>&
  command_names();

  private:
  void
  _run(const std::string &command, const rcs::stl::vector<rcs::value> &args);

  std::ostream &m_out;
  rcs::literal_parser m_parser;
  std::optional<rcs::literal_reader> m_reader;
  std::string m_command;
}; // class session
