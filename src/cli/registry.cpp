#include "cli/registry.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <string>

namespace lfly::cli {

namespace {

std::map<std::string, Command, std::less<>> &table() {
  static std::map<std::string, Command, std::less<>> t;
  return t;
}

const char *group_title(Group g) {
  switch (g) {
  case Group::Setup:
    return "setup";
  case Group::Transfer:
    return "transfer objects";
  case Group::Filter:
    return "filters (stdin to stdout)";
  case Group::Worktree:
    return "working tree";
  }
  return "other";
}

void print_synopsis(std::ostream &out, const Command &cmd) {
  out << "usage: lfly " << cmd.name;
  if (!cmd.synopsis.empty()) {
    out << ' ' << cmd.synopsis;
  }
  out << "\n";
}

} // namespace

void register_command(Command cmd) {
  auto name = cmd.name;
  table().insert_or_assign(std::move(name), std::move(cmd));
}

const Command *find_command(std::string_view name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : &it->second;
}

void print_usage(std::ostream &out) {
  std::size_t width = 0;
  for (const auto &[name, cmd] : table()) {
    width = std::max(width, name.size());
  }

  out << "usage: lfly <command> [args]\n";
  for (const Group g : {Group::Setup, Group::Transfer, Group::Filter, Group::Worktree}) {
    bool heading = false;
    for (const auto &[name, cmd] : table()) {
      if (cmd.group != g) {
        continue;
      }
      if (!heading) {
        out << "\n" << group_title(g) << ":\n";
        heading = true;
      }
      out << "  " << name << std::string(width - name.size() + 2, ' ') << cmd.summary << "\n";
    }
  }
}

int dispatch(int argc, char **argv) {
  if (argc < 2) {
    print_usage(std::cerr);
    return 2;
  }
  const std::string_view name = argv[1];
  if (name == "help" || name == "--help" || name == "-h") {
    print_usage(std::cout);
    return 0;
  }

  const Command *cmd = find_command(name);
  if (cmd == nullptr) {
    std::cerr << "unknown command: " << name << "\n";
    print_usage(std::cerr);
    return 2;
  }

  try {
    return cmd->fn(argc - 1, argv + 1);
  } catch (const UsageError &e) {
    std::cerr << cmd->name << ": " << e.what() << "\n";
    print_synopsis(std::cerr, *cmd);
    return 2;
  } catch (const std::exception &e) {
    std::cerr << cmd->name << ": " << e.what() << "\n";
    return 1;
  }
}

void no_arguments(int argc, char **argv) {
  if (argc > 1) {
    throw UsageError(std::string("unexpected argument '") + argv[1] + "'");
  }
}

} // namespace lfly::cli
