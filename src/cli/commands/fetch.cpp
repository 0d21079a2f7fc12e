#include "cli/context.hpp"

#include <filesystem>

int cmd_fetch(int argc, char **argv) {
  const auto args = lfly::cli::parse_transfer_args(argc, argv);
  lfly::cli::Context ctx{lfly::cli::find_root(std::filesystem::current_path())};
  const auto refs = lfly::cli::refs_for(ctx, args);
  return lfly::cli::download_refs(ctx, refs, args.dry_run, "fetch") == 0 ? 0 : 1;
}
