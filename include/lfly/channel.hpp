#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace lfly {

/**
 * Multi-producer / multi-consumer queue with close semantics.
 *
 * capacity == 0 means unbounded; otherwise send() blocks while full.
 * receive() blocks until an item arrives or the channel is closed and
 * drained, in which case it returns std::nullopt.
 */
template <typename T> class Channel {
public:
  explicit Channel(std::size_t capacity = 0) : capacity_{capacity} {}

  Channel(const Channel &) = delete;
  auto operator=(const Channel &) -> Channel & = delete;

  // Throws std::logic_error when sending on a closed channel.
  void send(T value) {
    std::unique_lock lock(mu_);
    not_full_.wait(lock, [&] { return closed_ || capacity_ == 0 || items_.size() < capacity_; });
    if (closed_) {
      throw std::logic_error("send on closed channel");
    }
    items_.push_back(std::move(value));
    not_empty_.notify_one();
  }

  auto receive() -> std::optional<T> {
    std::unique_lock lock(mu_);
    not_empty_.wait(lock, [&] { return closed_ || !items_.empty(); });
    if (items_.empty()) {
      return std::nullopt;
    }
    T v = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    return v;
  }

  // Idempotent. Buffered items stay readable.
  void close() {
    std::lock_guard lock(mu_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

private:
  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_{false};
};

// Counts outstanding work; wait() blocks until the count returns to zero.
class WaitGroup {
public:
  void add(int n = 1) {
    std::lock_guard lock(mu_);
    count_ += n;
    if (count_ < 0) {
      throw std::logic_error("negative WaitGroup counter");
    }
    if (count_ == 0) {
      zero_.notify_all();
    }
  }

  void done() { add(-1); }

  void wait() {
    std::unique_lock lock(mu_);
    zero_.wait(lock, [&] { return count_ == 0; });
  }

private:
  std::mutex mu_;
  std::condition_variable zero_;
  long count_{0};
};

} // namespace lfly
