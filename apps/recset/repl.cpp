#include "repl.hpp"
#include "session.hpp"

#include <cstdlib>
#include <cstring>
#include <string>

// Readline headers
#include <readline/readline.h>
#include <readline/history.h>


static const char *history_file = ".recset_history";


// Read a line with prompt using readline
bool
prompt_line(const std::string &prompt, std::string &line)
{
  char *input = readline(prompt.c_str());

  // EOF
  if (not input)
    return false;

  line = input;
  if (not line.empty())
    add_history(input);

  free(input);
  return true;
}


// Completion of command names
static char *
_command_generator(const char *text, int state)
{
  static size_t index;
  if (state == 0)
    index = 0;

  const auto &names = session::command_names();
  while (index < names.size())
  {
    const std::string &name = names[index++];
    if (name.compare(0, strlen(text), text) == 0)
      return strdup(name.c_str());
  }
  return nullptr;
}


static char **
_recset_completion(const char *text, int start, [[maybe_unused]] int end)
{
  rl_attempted_completion_over = 1;
  // Only the command name is completed
  if (start != 0)
    return nullptr;
  return rl_completion_matches(text, _command_generator);
}


void
init_readline()
{
  rl_readline_name = "recset";
  rl_attempted_completion_function = _recset_completion;
  rl_bind_key('\t', rl_complete);
  read_history(history_file);
}


void
cleanup_readline()
{
  write_history(history_file);
  history_truncate_file(history_file, 500);
}
