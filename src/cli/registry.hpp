#pragma once
#include "cli/command.hpp"

#include <iosfwd>
#include <string_view>

namespace lfly::cli {

void register_command(Command cmd);
// nullptr for an unknown name
const Command *find_command(std::string_view name);

// Commands by group, with their synopsis and summary.
void print_usage(std::ostream &out);

/**
 * Run `lfly <command> [args]`. The handler gets argv starting at the
 * command name. A UsageError prints the synopsis and returns 2; any other
 * std::exception prints "<command>: <what>" and returns 1.
 */
int dispatch(int argc, char **argv);

// Throws UsageError when anything follows the command name.
void no_arguments(int argc, char **argv);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace lfly::cli
