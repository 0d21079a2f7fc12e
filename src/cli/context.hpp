#pragma once
#include "lfly/adapter.hpp"
#include "lfly/batch_client.hpp"
#include "lfly/config.hpp"
#include "lfly/object_store.hpp"
#include "lfly/worktree.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace lfly::cli {

// Nearest directory from `start` upwards holding .lfly; throws when there is none.
std::filesystem::path find_root(const std::filesystem::path& start);

// Everything a transfer command needs, built once per invocation.
struct Context {
  explicit Context(std::filesystem::path root_dir);
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  std::filesystem::path root;
  Settings settings;
  ObjectStore store;
  Manifest manifest;
  HttpBatchClient client;
};

// Flags shared by push/fetch/pull
struct TransferArgs {
  bool dry_run = false;
  std::string object_list; // read refs from this file instead of scanning the worktree
};

// Parses --dry-run and --object-list <file>; throws UsageError on anything else.
TransferArgs parse_transfer_args(int argc, char** argv);

// Refs named by the arguments: the object list, or every pointer in the worktree.
std::vector<ObjectRef> refs_for(const Context& ctx, const TransferArgs& args);

// One download queue over `refs`, drawing progress on stderr. Returns the error count.
int download_refs(Context& ctx, const std::vector<ObjectRef>& refs, bool dry_run,
                  const char* cmd);

} // namespace lfly::cli
