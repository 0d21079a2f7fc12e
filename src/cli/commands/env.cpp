#include "cli/context.hpp"
#include "cli/registry.hpp"
#include "lfly/trace.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_names(const char *key, const std::vector<std::string> &names) {
  std::cout << key << "=";
  const char *sep = "";
  for (const auto &n : names) {
    std::cout << sep << n;
    sep = ",";
  }
  std::cout << "\n";
}

} // namespace

int cmd_env(int argc, char **argv) {
  lfly::cli::no_arguments(argc, argv);
  lfly::cli::Context ctx{lfly::cli::find_root(std::filesystem::current_path())};
  const auto &s = ctx.settings;
  std::cout << "Endpoint=" << (s.endpoint.empty() ? "(unset)" : s.endpoint) << "\n";
  std::cout << "LocalWorkingDir=" << ctx.root.string() << "\n";
  std::cout << "LocalMediaDir=" << ctx.store.objects_dir().string() << "\n";
  std::cout << "TempDir=" << ctx.store.tmp_dir().string() << "\n";
  std::cout << "ConcurrentTransfers=" << s.concurrent_transfers << "\n";
  std::cout << "BatchSize=" << s.batch_size << "\n";
  std::cout << "MaxAttempts=" << s.max_attempts << "\n";
  std::cout << "BasicTransfersOnly=" << (s.basic_transfers_only ? "true" : "false") << "\n";
  std::cout << "AllowIncompletePush=" << (s.allow_incomplete_push ? "true" : "false") << "\n";
  std::cout << "HttpTimeout=" << s.http_timeout << "\n";
  std::cout << "SslVerify=" << (s.ssl_verify ? "true" : "false") << "\n";
  print_names("UploadTransfers", ctx.manifest.adapter_names(lfly::Direction::Upload));
  print_names("DownloadTransfers", ctx.manifest.adapter_names(lfly::Direction::Download));
  std::cout << "Trace=" << (lfly::trace_enabled() ? "true" : "false") << "\n";
  return 0;
}
