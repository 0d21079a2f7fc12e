#pragma once
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace lfly {

// Per-oid attempt counts with a fixed ceiling. Safe to share between threads.
class RetryCounter {
public:
  explicit RetryCounter(int max_attempts);

  void increment(const std::string &oid);
  [[nodiscard]] auto count_for(const std::string &oid) const -> int;

  // {attempts so far, attempts < max}
  [[nodiscard]] auto can_retry(const std::string &oid) const -> std::pair<int, bool>;

  [[nodiscard]] auto max_attempts() const noexcept -> int { return max_; }

private:
  const int max_;
  mutable std::mutex mu_;
  std::map<std::string, int> counts_;
};

} // namespace lfly
