#include "cli/context.hpp"
#include "cli/registry.hpp"

#include <filesystem>
#include <iostream>

int cmd_checkout(int argc, char **argv) {
  lfly::cli::no_arguments(argc, argv);
  const auto root = lfly::cli::find_root(std::filesystem::current_path());
  const auto store = lfly::ObjectStore::for_repo(root);
  const auto res = lfly::worktree::checkout(root, store);
  for (const auto &name : res.written) {
    std::cout << "checkout " << name << "\n";
  }
  for (const auto &name : res.missing) {
    std::cerr << "checkout: skipping " << name << ", object not present (run 'lfly fetch')\n";
  }
  return 0;
}
