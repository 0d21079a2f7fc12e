#include "cli/context.hpp"
#include "cli/command.hpp"

#include "lfly/basic_adapter.hpp"
#include "lfly/consts.hpp"
#include "lfly/progress.hpp"
#include "lfly/sync.hpp"

#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace stdfs = std::filesystem;

namespace lfly::cli {

stdfs::path find_root(const stdfs::path& start) {
  for (auto p = stdfs::absolute(start); !p.empty(); p = p.parent_path()) {
    if (stdfs::is_directory(p / consts::kStateDir)) {
      return p;
    }
    if (p == p.root_path()) {
      break;
    }
  }
  throw std::runtime_error("not an lfly repository (or any parent): run 'lfly init'");
}

Context::Context(stdfs::path root_dir)
    : root{std::move(root_dir)}, settings{load_settings(root)}, store{ObjectStore::for_repo(root)},
      manifest{settings.basic_transfers_only},
      client{settings.endpoint, RetryPolicy{settings}, settings.http_timeout, settings.ssl_verify} {
  register_basic_adapter(manifest, store, settings);
}

TransferArgs parse_transfer_args(int argc, char** argv) {
  TransferArgs out;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--dry-run") == 0) {
      out.dry_run = true;
    } else if (std::strcmp(argv[i], "--object-list") == 0 && i + 1 < argc) {
      out.object_list = argv[++i];
    } else {
      throw UsageError(std::string("unexpected argument '") + argv[i] + "'");
    }
  }
  return out;
}

std::vector<ObjectRef> refs_for(const Context& ctx, const TransferArgs& args) {
  if (args.object_list.empty()) {
    WorktreeRefs src{ctx.root};
    return collect_refs(src);
  }
  std::ifstream in(args.object_list);
  if (!in) {
    throw std::runtime_error("cannot open object list " + args.object_list);
  }
  LineRefReader src{in};
  return collect_refs(src);
}

int download_refs(Context& ctx, const std::vector<ObjectRef>& refs, bool dry_run,
                  const char* cmd) {
  std::vector<ObjectRef> missing;
  for (const auto& r : refs) {
    if (!ctx.store.exists(r.oid, r.size)) {
      missing.push_back(r);
    }
  }
  if (missing.empty()) {
    return 0;
  }

  TextMeter meter{std::cerr, "Downloading objects"};
  QueueOptions opts;
  opts.dry_run = dry_run;
  opts.meter = &meter;
  const auto report =
      transfer_refs(Direction::Download, missing, ctx.store, ctx.settings, ctx.client, ctx.manifest, opts);

  if (dry_run) {
    for (const auto& oid : report.completed) {
      std::cout << "would download " << oid << "\n";
    }
  }
  for (const auto& e : report.errors) {
    std::cerr << cmd << ": " << e.what() << "\n";
  }
  return static_cast<int>(report.errors.size());
}

} // namespace lfly::cli
