#include "lfly/progress.hpp"

#include <iomanip>
#include <iterator>
#include <ostream>
#include <sstream>

namespace lfly {

std::string format_bytes(std::int64_t n) {
  static constexpr const char *kUnits[] = {"B", "KB", "MB", "GB", "TB"};
  auto v = static_cast<double>(n);
  std::size_t u = 0;
  while (v >= 1000.0 && u + 1 < std::size(kUnits)) {
    v /= 1000.0;
    ++u;
  }
  std::ostringstream os;
  if (u == 0) {
    os << n << " B";
  } else {
    os << std::fixed << std::setprecision(1) << v << ' ' << kUnits[u];
  }
  return os.str();
}

void TextMeter::start() {
  std::lock_guard lock(mu_);
  started_ = true;
}

void TextMeter::add(std::int64_t size) {
  std::lock_guard lock(mu_);
  ++files_total_;
  bytes_total_ += size;
}

void TextMeter::start_transfer(const std::string &name) {
  std::lock_guard lock(mu_);
  // a retry starts over
  if (const auto it = in_flight_.find(name); it != in_flight_.end()) {
    in_flight_bytes_ -= it->second;
    it->second = 0;
  } else {
    in_flight_.emplace(name, 0);
  }
  redraw_locked(false);
}

void TextMeter::transfer_bytes(std::string_view, const std::string &name, std::int64_t read,
                               std::int64_t, std::int64_t) {
  std::lock_guard lock(mu_);
  auto &seen = in_flight_[name];
  in_flight_bytes_ += read - seen;
  seen = read;
  redraw_locked(false);
}

void TextMeter::finish_transfer(const std::string &name) {
  std::lock_guard lock(mu_);
  if (const auto it = in_flight_.find(name); it != in_flight_.end()) {
    in_flight_bytes_ -= it->second;
    bytes_done_ += it->second;
    in_flight_.erase(it);
  }
  ++files_done_;
  redraw_locked(false);
}

void TextMeter::skip(std::int64_t size) {
  std::lock_guard lock(mu_);
  ++files_done_;
  ++files_skipped_;
  bytes_done_ += size;
  redraw_locked(false);
}

void TextMeter::finish() {
  std::lock_guard lock(mu_);
  if (started_ && files_total_ > 0) {
    redraw_locked(true);
  }
  started_ = false;
}

int TextMeter::files_done() const {
  std::lock_guard lock(mu_);
  return files_done_;
}

std::int64_t TextMeter::bytes_done() const {
  std::lock_guard lock(mu_);
  return bytes_done_ + in_flight_bytes_;
}

void TextMeter::redraw_locked(bool final_line) {
  if (!started_) {
    return;
  }
  out_ << '\r' << label_ << ": (" << files_done_ << " of " << files_total_ << " files";
  if (files_skipped_ > 0) {
    out_ << ", " << files_skipped_ << " skipped";
  }
  out_ << ") " << format_bytes(bytes_done_ + in_flight_bytes_) << " / " << format_bytes(bytes_total_);
  if (final_line) {
    out_ << ", done.\n";
  }
  out_.flush();
}

} // namespace lfly
