#include "cli/context.hpp"
#include "lfly/progress.hpp"
#include "lfly/sync.hpp"

#include <filesystem>
#include <iostream>

int cmd_push(int argc, char **argv) {
  const auto args = lfly::cli::parse_transfer_args(argc, argv);
  lfly::cli::Context ctx{lfly::cli::find_root(std::filesystem::current_path())};
  const auto refs = lfly::cli::refs_for(ctx, args);

  lfly::TextMeter meter{std::cerr, "Uploading objects"};
  lfly::QueueOptions opts;
  opts.dry_run = args.dry_run;
  opts.meter = &meter;
  const auto report = lfly::transfer_refs(lfly::Direction::Upload, refs, ctx.store, ctx.settings,
                                          ctx.client, ctx.manifest, opts);

  if (args.dry_run) {
    for (const auto &oid : report.completed) {
      std::cout << "push " << oid << "\n";
    }
  }

  int missing = 0;
  int failed = 0;
  for (const auto &e : report.errors) {
    if (e.kind() == lfly::ErrorKind::Store) {
      ++missing;
      std::cerr << "push: missing local object: " << e.what() << "\n";
    } else {
      ++failed;
      std::cerr << "push: " << e.what() << "\n";
    }
  }
  if (missing > 0 && !ctx.settings.allow_incomplete_push) {
    std::cerr << "push: " << missing
              << " object(s) missing locally; set allow_incomplete_push to push anyway\n";
    return 1;
  }
  return failed == 0 ? 0 : 1;
}
