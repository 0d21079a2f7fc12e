#include "lfly/retry_counter.hpp"

#include "lfly/trace.hpp"

namespace lfly {

RetryCounter::RetryCounter(int max_attempts) : max_{max_attempts < 1 ? 1 : max_attempts} {
  if (max_attempts < 1) {
    trace("tq: invalid retry count ", max_attempts, ", using 1");
  }
}

void RetryCounter::increment(const std::string &oid) {
  std::lock_guard lock(mu_);
  ++counts_[oid];
}

int RetryCounter::count_for(const std::string &oid) const {
  std::lock_guard lock(mu_);
  const auto it = counts_.find(oid);
  return it == counts_.end() ? 0 : it->second;
}

std::pair<int, bool> RetryCounter::can_retry(const std::string &oid) const {
  const int n = count_for(oid);
  return {n, n < max_};
}

} // namespace lfly
