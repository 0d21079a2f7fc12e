#include "cli/command.hpp"
#include "cli/context.hpp"

#include <cstring>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>

// Rehash every stored or referenced object; move corrupt ones to .lfly/bad
int cmd_fsck(int argc, char **argv) {
  bool dry_run = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--dry-run") == 0) {
      dry_run = true;
    } else {
      throw lfly::cli::UsageError(std::string("unexpected argument '") + argv[i] + "'");
    }
  }
  const auto root = lfly::cli::find_root(std::filesystem::current_path());
  const auto store = lfly::ObjectStore::for_repo(root);

  // oid -> display name
  std::map<std::string, std::string> oids;
  for (const auto &oid : store.list()) {
    oids.emplace(oid, oid);
  }
  for (const auto &ref : lfly::worktree::scan_pointers(root)) {
    oids[ref.oid] = ref.name;
  }

  int corrupt = 0;
  for (const auto &[oid, name] : oids) {
    if (store.verify(oid) != lfly::VerifyStatus::Corrupt) {
      continue;
    }
    ++corrupt;
    std::cout << "Object " << name << " (" << oid << ") is corrupt\n";
    if (!dry_run) {
      const auto to = store.quarantine(oid);
      std::cout << "  moved to " << to.string() << "\n";
    }
  }
  if (corrupt == 0) {
    std::cout << "lfly fsck OK\n";
    return 0;
  }
  return 1;
}
