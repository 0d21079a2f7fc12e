#pragma once
#include <sstream>
#include <string_view>

namespace lfly {

// True when LFLY_TRACE is set to something other than "", "0" or "false".
bool trace_enabled();

void trace_line(std::string_view line);

// trace("tq: sending batch of size ", n) -> "trace lfly: tq: sending batch of size 3" on stderr
template <typename... Args> void trace(const Args &...args) {
  if (!trace_enabled()) {
    return;
  }
  std::ostringstream os;
  (os << ... << args);
  trace_line(os.str());
}

} // namespace lfly
