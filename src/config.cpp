#include "lfly/config.hpp"

#include "lfly/fs.hpp"
#include "lfly/trace.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::optional<int> parse_int(std::string_view sv) {
  int v = 0;
  const auto *end = sv.data() + sv.size();
  auto [p, ec] = std::from_chars(sv.data(), end, v);
  if (ec != std::errc{} || p != end) {
    return std::nullopt;
  }
  return v;
}

std::optional<bool> parse_bool(std::string_view sv) {
  std::string s(sv);
  std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
  if (s == "true" || s == "1" || s == "yes" || s == "on")
    return true;
  if (s == "false" || s == "0" || s == "no" || s == "off")
    return false;
  return std::nullopt;
}

std::optional<std::set<int>> parse_int_list(std::string_view sv) {
  std::set<int> out;
  std::string item;
  std::istringstream iss{std::string(sv)};
  while (std::getline(iss, item, ',')) {
    const auto t = trim(item);
    if (t.empty())
      continue;
    auto v = parse_int(t);
    if (!v)
      return std::nullopt;
    out.insert(*v);
  }
  return out;
}

// Values below 1 are coerced to 1.
void set_positive(int &field, std::string_view key, std::string_view value) {
  auto v = parse_int(value);
  if (!v) {
    lfly::trace("config: invalid integer for ", key, ": '", value, "', keeping ", field);
    return;
  }
  if (*v < 1) {
    lfly::trace("config: ", key, " must be >= 1, got ", *v, ", using 1");
    *v = 1;
  }
  field = *v;
}

void set_bool(bool &field, std::string_view key, std::string_view value) {
  if (auto v = parse_bool(value)) {
    field = *v;
  } else {
    lfly::trace("config: invalid boolean for ", key, ": '", value, "'");
  }
}

constexpr std::string_view kKeys[] = {
    "endpoint",       "concurrent_transfers", "batch_size",         "buffer_depth",
    "max_attempts",   "basic_transfers_only", "allow_incomplete_push", "http_timeout",
    "retriable_statuses", "retry_transport_errors", "ssl_verify",
};

} // namespace

namespace lfly {

std::filesystem::path config_path(const std::filesystem::path &root) {
  return root / consts::kStateDir / consts::kConfigFile;
}

void apply_setting(Settings &s, std::string_view key, std::string_view value) {
  if (key == "endpoint") {
    s.endpoint = std::string(value);
  } else if (key == "concurrent_transfers") {
    set_positive(s.concurrent_transfers, key, value);
  } else if (key == "batch_size") {
    set_positive(s.batch_size, key, value);
  } else if (key == "buffer_depth") {
    set_positive(s.buffer_depth, key, value);
  } else if (key == "max_attempts") {
    set_positive(s.max_attempts, key, value);
  } else if (key == "basic_transfers_only") {
    set_bool(s.basic_transfers_only, key, value);
  } else if (key == "allow_incomplete_push") {
    set_bool(s.allow_incomplete_push, key, value);
  } else if (key == "http_timeout") {
    set_positive(s.http_timeout, key, value);
  } else if (key == "retriable_statuses") {
    if (auto v = parse_int_list(value)) {
      s.retriable_statuses = std::move(*v);
    } else {
      trace("config: invalid status list for ", key, ": '", value, "'");
    }
  } else if (key == "retry_transport_errors") {
    set_bool(s.retry_transport_errors, key, value);
  } else if (key == "ssl_verify") {
    set_bool(s.ssl_verify, key, value);
    if (!s.ssl_verify) {
      trace("config: TLS certificate verification is disabled");
    }
  } else {
    trace("config: ignoring unknown key '", key, "'");
  }
}

Settings load_settings(const std::filesystem::path &root) {
  Settings out{};
  const auto path = config_path(root);
  if (fs::exists(path)) {
    const auto bytes = fs::read_file(path);
    const std::string text(bytes.begin(), bytes.end());
    std::istringstream iss(text);

    std::string line;
    while (std::getline(iss, line)) {
      std::string_view sv{line};
      if (trim(sv).empty() || sv[0] == '#')
        continue; // allow comments
      const auto colon = sv.find(':');
      if (colon == std::string_view::npos) {
        trace("config: skipping malformed line '", line, "'");
        continue;
      }
      apply_setting(out, trim(sv.substr(0, colon)), trim(sv.substr(colon + 1)));
    }
  }

  if (const char *v = std::getenv("GIT_SSL_NO_VERIFY"); v != nullptr && *v != '\0') {
    out.ssl_verify = false;
  }
  for (const auto key : kKeys) {
    std::string env = "LFLY_";
    std::ranges::transform(key, std::back_inserter(env),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (const char *v = std::getenv(env.c_str()); v != nullptr) {
      apply_setting(out, key, trim(v));
    }
  }
  return out;
}

void save_settings(const std::filesystem::path &root, const Settings &s) {
  std::ostringstream os;
  os << "endpoint: " << s.endpoint << '\n'
     << "concurrent_transfers: " << s.concurrent_transfers << '\n'
     << "batch_size: " << s.batch_size << '\n';
  if (s.buffer_depth > 0)
    os << "buffer_depth: " << s.buffer_depth << '\n';
  os << "max_attempts: " << s.max_attempts << '\n'
     << "basic_transfers_only: " << (s.basic_transfers_only ? "true" : "false") << '\n'
     << "allow_incomplete_push: " << (s.allow_incomplete_push ? "true" : "false") << '\n'
     << "http_timeout: " << s.http_timeout << '\n'
     << "retriable_statuses: ";
  bool first = true;
  for (int st : s.retriable_statuses) {
    os << (first ? "" : ",") << st;
    first = false;
  }
  os << '\n' << "retry_transport_errors: " << (s.retry_transport_errors ? "true" : "false") << '\n'
     << "ssl_verify: " << (s.ssl_verify ? "true" : "false") << '\n';

  const auto path = config_path(root);
  const std::string str = os.str();
  const auto *data = reinterpret_cast<const std::uint8_t *>(str.data());
  fs::write_file_atomic(path, std::span(data, str.size()));
}

} // namespace lfly
