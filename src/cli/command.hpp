#pragma once
#include <stdexcept>
#include <string>

namespace lfly::cli {

// argv[0] is the subcommand name
using command_fn = int (*)(int argc, char **argv);

// Bad command line. dispatch() prints the command's synopsis and exits with 2.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Sections of the usage text, printed in this order.
enum class Group { Setup, Transfer, Filter, Worktree };

struct Command {
  std::string name;
  Group group = Group::Setup;
  command_fn fn = nullptr;
  std::string synopsis; // arguments after the name, e.g. "[--dry-run]"
  std::string summary;
};

} // namespace lfly::cli
