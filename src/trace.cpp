#include "lfly/trace.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace lfly {

bool trace_enabled() {
  static const bool enabled = [] {
    const char *v = std::getenv("LFLY_TRACE");
    if (v == nullptr) {
      return false;
    }
    const std::string_view s{v};
    return !s.empty() && s != "0" && s != "false";
  }();
  return enabled;
}

void trace_line(std::string_view line) {
  // workers trace concurrently; keep lines whole
  static std::mutex mu;
  std::string out{"trace lfly: "};
  out.append(line);
  out.push_back('\n');
  std::lock_guard lock(mu);
  std::cerr << out;
}

} // namespace lfly
