#pragma once
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace lfly {

// Byte-level progress from the queue and its adapter.
class ProgressMeter {
public:
  virtual ~ProgressMeter() = default;

  virtual void start() = 0;
  // A new object entered the queue.
  virtual void add(std::int64_t size) = 0;
  virtual void start_transfer(const std::string &name) = 0;
  // (kind, name, bytes so far, total, bytes in this chunk)
  virtual void transfer_bytes(std::string_view kind, const std::string &name, std::int64_t read,
                              std::int64_t total, std::int64_t current) = 0;
  virtual void finish_transfer(const std::string &name) = 0;
  // An object that needed no transfer.
  virtual void skip(std::int64_t size) = 0;
  virtual void finish() = 0;
};

class NoopMeter final : public ProgressMeter {
public:
  void start() override {}
  void add(std::int64_t) override {}
  void start_transfer(const std::string &) override {}
  void transfer_bytes(std::string_view, const std::string &, std::int64_t, std::int64_t,
                      std::int64_t) override {}
  void finish_transfer(const std::string &) override {}
  void skip(std::int64_t) override {}
  void finish() override {}
};

/**
 * One status line, rewritten in place:
 *   Downloading objects: (2 of 5 files, 1 skipped) 3.1 MB / 9.0 MB
 * Bytes of an unfinished attempt count until the object starts its next
 * attempt, so retries never push the total past 100%.
 */
class TextMeter final : public ProgressMeter {
public:
  TextMeter(std::ostream &out, std::string label) : out_{out}, label_{std::move(label)} {}

  void start() override;
  void add(std::int64_t size) override;
  void start_transfer(const std::string &name) override;
  void transfer_bytes(std::string_view kind, const std::string &name, std::int64_t read,
                      std::int64_t total, std::int64_t current) override;
  void finish_transfer(const std::string &name) override;
  void skip(std::int64_t size) override;
  void finish() override;

  [[nodiscard]] auto files_done() const -> int;
  // finished plus in-flight bytes, as drawn
  [[nodiscard]] auto bytes_done() const -> std::int64_t;

private:
  void redraw_locked(bool final_line);

  std::ostream &out_;
  std::string label_;
  mutable std::mutex mu_;
  int files_total_{0};
  int files_done_{0};
  int files_skipped_{0};
  std::int64_t bytes_total_{0};
  std::int64_t bytes_done_{0};
  std::map<std::string, std::int64_t, std::less<>> in_flight_; // name -> bytes of the current attempt
  std::int64_t in_flight_bytes_{0};
  bool started_{false};
};

// "1.5 MB"
std::string format_bytes(std::int64_t n);

} // namespace lfly
