#include "cli/context.hpp"
#include "cli/registry.hpp"

#include <filesystem>
#include <iostream>

// "<oid prefix> <*|-> <path>": '*' when the object is in the local store
int cmd_ls_files(int argc, char **argv) {
  lfly::cli::no_arguments(argc, argv);
  const auto root = lfly::cli::find_root(std::filesystem::current_path());
  const auto store = lfly::ObjectStore::for_repo(root);
  for (const auto &ref : lfly::worktree::scan_pointers(root)) {
    const bool present = store.exists(ref.oid, ref.size);
    std::cout << ref.oid.substr(0, 10) << ' ' << (present ? '*' : '-') << ' ' << ref.name << "\n";
  }
  return 0;
}
