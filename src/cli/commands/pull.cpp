#include "cli/command.hpp"
#include "cli/context.hpp"

#include <filesystem>
#include <iostream>

// fetch, then replace pointer files with what arrived
int cmd_pull(int argc, char **argv) {
  const auto args = lfly::cli::parse_transfer_args(argc, argv);
  if (args.dry_run) {
    throw lfly::cli::UsageError("--dry-run is not supported");
  }
  lfly::cli::Context ctx{lfly::cli::find_root(std::filesystem::current_path())};
  const auto refs = lfly::cli::refs_for(ctx, args);
  const int failed = lfly::cli::download_refs(ctx, refs, false, "pull");

  const auto res = lfly::worktree::checkout(ctx.root, ctx.store);
  for (const auto &name : res.missing) {
    std::cerr << "pull: " << name << " not checked out, object missing\n";
  }
  std::cout << "Checked out " << res.written.size() << " file(s)\n";
  return failed == 0 && res.missing.empty() ? 0 : 1;
}
