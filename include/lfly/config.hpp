#pragma once
#include "lfly/consts.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace lfly {

// Read-only snapshot handed to a queue at construction.
struct Settings {
  std::string endpoint;  // batch API base URL, e.g. "https://host/repo.git/info/lfs"
  int concurrent_transfers = consts::kDefaultConcurrentTransfers;
  int batch_size = consts::kDefaultBatchSize;
  int buffer_depth = 0;  // 0: same as batch_size
  int max_attempts = consts::kDefaultMaxAttempts;
  bool basic_transfers_only = false;
  bool allow_incomplete_push = true;
  int http_timeout = consts::kDefaultHttpTimeoutSeconds; // seconds
  std::set<int> retriable_statuses{408, 429, 500, 502, 503, 504};
  bool retry_transport_errors = true;
  bool ssl_verify = true; // check the server certificate on https

  [[nodiscard]] auto effective_buffer_depth() const -> int {
    return buffer_depth > 0 ? buffer_depth : batch_size;
  }
};

// Explicit retriable/terminal classification for network failures.
class RetryPolicy {
public:
  RetryPolicy() = default;
  explicit RetryPolicy(const Settings &s)
      : statuses_{s.retriable_statuses}, transport_{s.retry_transport_errors} {}

  [[nodiscard]] auto status_is_retriable(int status) const -> bool {
    return statuses_.contains(status);
  }
  [[nodiscard]] auto transport_is_retriable() const -> bool { return transport_; }

private:
  std::set<int> statuses_{408, 429, 500, 502, 503, 504};
  bool transport_{true};
};

// <root>/.lfly/config
std::filesystem::path config_path(const std::filesystem::path& root);

// Defaults, then <root>/.lfly/config ("key: value" lines), then LFLY_<KEY> env vars.
Settings load_settings(const std::filesystem::path& root);

// Apply one "key", "value" pair; unknown keys and bad values are ignored (traced).
void apply_setting(Settings& s, std::string_view key, std::string_view value);

// Overwrite <root>/.lfly/config with the given settings
void save_settings(const std::filesystem::path& root, const Settings& s);

} // namespace lfly
