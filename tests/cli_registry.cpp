#include "cli/registry.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

int ok_cmd(int, char **) { return 0; }

int bad_args_cmd(int argc, char **argv) {
  lfly::cli::no_arguments(argc, argv);
  return 0;
}

int failing_cmd(int, char **) { throw std::runtime_error("server said no"); }

// Runs dispatch with stderr captured.
int run(std::vector<std::string> args, std::string &err) {
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);

  std::ostringstream captured;
  auto *old = std::cerr.rdbuf(captured.rdbuf());
  const int rc = lfly::cli::dispatch(static_cast<int>(args.size()), argv.data());
  std::cerr.rdbuf(old);
  err = captured.str();
  return rc;
}

} // namespace

int main() {
  using lfly::cli::Group;
  lfly::cli::register_command({"zz-ok", Group::Worktree, &ok_cmd, "", "always works"});
  lfly::cli::register_command({"aa-args", Group::Setup, &bad_args_cmd, "", "takes nothing"});
  lfly::cli::register_command(
      {"mm-fail", Group::Transfer, &failing_cmd, "[--dry-run]", "always throws"});

  std::string err;
  if (run({"lfly", "zz-ok"}, err) != 0 || !err.empty()) {
    std::cerr << "successful command should return 0 quietly\n";
    return 1;
  }

  if (run({"lfly", "aa-args", "extra"}, err) != 2) {
    std::cerr << "usage error should return 2\n";
    return 1;
  }
  if (err.find("aa-args: unexpected argument 'extra'") == std::string::npos ||
      err.find("usage: lfly aa-args\n") == std::string::npos) {
    std::cerr << "usage error output: " << err;
    return 1;
  }

  if (run({"lfly", "mm-fail"}, err) != 1) {
    std::cerr << "failing command should return 1\n";
    return 1;
  }
  if (err != "mm-fail: server said no\n") {
    std::cerr << "failure output: " << err;
    return 1;
  }

  if (run({"lfly", "nope"}, err) != 2 || err.find("unknown command: nope") == std::string::npos) {
    std::cerr << "unknown command should return 2\n";
    return 1;
  }
  if (run({"lfly"}, err) != 2 || err.find("usage: lfly <command>") == std::string::npos) {
    std::cerr << "missing command should print usage and return 2\n";
    return 1;
  }
  if (run({"lfly", "help"}, err) != 0) {
    std::cerr << "help should return 0\n";
    return 1;
  }

  if (lfly::cli::find_command("mm-fail") == nullptr || lfly::cli::find_command("mm") != nullptr) {
    std::cerr << "find_command lookup wrong\n";
    return 1;
  }

  // groups print in a fixed order regardless of names
  std::ostringstream usage;
  lfly::cli::print_usage(usage);
  const auto text = usage.str();
  const auto setup = text.find("\nsetup:\n  aa-args");
  const auto transfer = text.find("\ntransfer objects:\n  mm-fail");
  const auto worktree = text.find("\nworking tree:\n  zz-ok");
  if (setup == std::string::npos || transfer == std::string::npos ||
      worktree == std::string::npos || !(setup < transfer && transfer < worktree)) {
    std::cerr << "usage groups out of order:\n" << text;
    return 1;
  }
  if (text.find("filters") != std::string::npos) {
    std::cerr << "empty group should not print a heading\n";
    return 1;
  }

  std::cout << "cli_registry OK\n";
  return 0;
}
