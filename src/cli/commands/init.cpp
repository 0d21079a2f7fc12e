#include "cli/command.hpp"
#include "lfly/config.hpp"
#include "lfly/consts.hpp"
#include "lfly/object_store.hpp"

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

int cmd_init(int argc, char **argv) {
  std::string endpoint;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--endpoint") == 0 && i + 1 < argc) {
      endpoint = argv[++i];
    } else {
      throw lfly::cli::UsageError(std::string("unexpected argument '") + argv[i] + "'");
    }
  }

  const std::filesystem::path root = std::filesystem::current_path();
  const auto store = lfly::ObjectStore::for_repo(root);
  std::filesystem::create_directories(store.objects_dir());
  std::filesystem::create_directories(store.tmp_dir());

  const bool fresh = !std::filesystem::exists(lfly::config_path(root));
  auto settings = lfly::load_settings(root);
  if (!endpoint.empty()) {
    settings.endpoint = endpoint;
  }
  if (fresh || !endpoint.empty()) {
    lfly::save_settings(root, settings);
  }
  std::cout << (fresh ? "Initialized empty lfly store in " : "Reinitialized lfly store in ")
            << store.root() << "\n";
  return 0;
}
