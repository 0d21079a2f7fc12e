#include "cli/context.hpp"
#include "cli/registry.hpp"
#include "lfly/filters.hpp"

#include <filesystem>
#include <iostream>

// stdin: file content, stdout: pointer
int cmd_clean(int argc, char **argv) {
  lfly::cli::no_arguments(argc, argv);
  const auto root = lfly::cli::find_root(std::filesystem::current_path());
  const auto store = lfly::ObjectStore::for_repo(root);
  const auto ptr = lfly::clean(std::cin, store);
  std::cout << lfly::encode_pointer(ptr);
  return std::cout.flush() ? 0 : 1;
}
