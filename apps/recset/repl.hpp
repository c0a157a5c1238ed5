#pragma once

#include <string>


void
init_readline();

void
cleanup_readline();

bool
prompt_line(const std::string &prompt, std::string &line);
