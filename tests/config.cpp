#include "lfly/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

namespace fs = std::filesystem;

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("lfly_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(root / ".lfly");

  try {
    // defaults without a file
    auto s = lfly::load_settings(root);
    if (s.batch_size != 100 || s.concurrent_transfers != 3 || s.max_attempts != 2 ||
        s.effective_buffer_depth() != 100 || !s.allow_incomplete_push ||
        s.basic_transfers_only || s.http_timeout != 30 || !s.retry_transport_errors ||
        !s.ssl_verify ||
        s.retriable_statuses != std::set<int>{408, 429, 500, 502, 503, 504}) {
      std::cerr << "unexpected defaults\n";
      return 1;
    }

    {
      std::ofstream(lfly::config_path(root)) << "# transfer settings\n"
                                             << "endpoint: https://example.com/repo/info/lfs\n"
                                             << "\n"
                                             << "batch_size:   25  \n"
                                             << "concurrent_transfers: 0\n"
                                             << "max_attempts: lots\n"
                                             << "basic_transfers_only: true\n"
                                             << "retriable_statuses: 503, 429\n"
                                             << "no colon on this line\n"
                                             << "mystery_key: 7\n";
    }
    s = lfly::load_settings(root);
    if (s.endpoint != "https://example.com/repo/info/lfs" || s.batch_size != 25 ||
        s.effective_buffer_depth() != 25) {
      std::cerr << "file values not applied\n";
      return 1;
    }
    if (s.concurrent_transfers != 1) {
      std::cerr << "non-positive value not coerced to 1\n";
      return 1;
    }
    if (s.max_attempts != 2) {
      std::cerr << "invalid integer should keep the default\n";
      return 1;
    }
    if (!s.basic_transfers_only || s.retriable_statuses != std::set<int>{429, 503}) {
      std::cerr << "bool/list values not applied\n";
      return 1;
    }

    // environment wins over the file
    ::setenv("LFLY_BATCH_SIZE", "7", 1);
    ::setenv("LFLY_RETRY_TRANSPORT_ERRORS", "false", 1);
    s = lfly::load_settings(root);
    ::unsetenv("LFLY_BATCH_SIZE");
    ::unsetenv("LFLY_RETRY_TRANSPORT_ERRORS");
    if (s.batch_size != 7 || s.retry_transport_errors) {
      std::cerr << "env override not applied\n";
      return 1;
    }

    // git's switch turns verification off; an explicit setting still wins
    ::setenv("GIT_SSL_NO_VERIFY", "1", 1);
    if (lfly::load_settings(root).ssl_verify) {
      ::unsetenv("GIT_SSL_NO_VERIFY");
      std::cerr << "GIT_SSL_NO_VERIFY did not disable verification\n";
      return 1;
    }
    ::setenv("LFLY_SSL_VERIFY", "true", 1);
    const bool forced = lfly::load_settings(root).ssl_verify;
    ::unsetenv("LFLY_SSL_VERIFY");
    ::unsetenv("GIT_SSL_NO_VERIFY");
    if (!forced) {
      std::cerr << "LFLY_SSL_VERIFY should override GIT_SSL_NO_VERIFY\n";
      return 1;
    }

    const lfly::RetryPolicy policy{s};
    if (!policy.status_is_retriable(503) || policy.status_is_retriable(500) ||
        policy.transport_is_retriable()) {
      std::cerr << "retry policy does not follow settings\n";
      return 1;
    }

    s.buffer_depth = 40;
    s.http_timeout = 5;
    s.ssl_verify = false;
    lfly::save_settings(root, s);
    const auto back = lfly::load_settings(root);
    if (back.endpoint != s.endpoint || back.buffer_depth != 40 || back.http_timeout != 5 ||
        back.retriable_statuses != s.retriable_statuses || back.retry_transport_errors ||
        back.ssl_verify) {
      std::cerr << "saved settings did not load back\n";
      return 1;
    }

    std::cout << "config OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
