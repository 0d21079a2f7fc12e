#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace lfly {

enum class ErrorKind : std::uint8_t {
  Negotiation,  // the batch call failed outright
  Object,       // the server rejected one object
  Transfer,     // an adapter failed to move one object
  SizeMismatch, // stored byte count differs from the declared size
  HashMismatch, // stored content does not hash to the oid
  Store,        // filesystem failure in the local store
};

auto to_string(ErrorKind kind) -> std::string_view;

/**
 * Every failure the engine reports. Copyable so results and the
 * queue's aggregate error list can hold it by value.
 *
 * `oid()` is empty for errors that are not about a single object
 * (e.g. an adapter that fails to start).
 */
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, std::string oid, const std::string &message, bool retriable)
      : std::runtime_error(message), kind_{kind}, oid_{std::move(oid)}, retriable_{retriable} {}

  [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }
  [[nodiscard]] auto oid() const noexcept -> const std::string & { return oid_; }
  [[nodiscard]] auto retriable() const noexcept -> bool { return retriable_; }

  // Same error, re-targeted at one object (a batch-wide failure fanned out per oid)
  [[nodiscard]] auto for_object(std::string oid) const -> Error {
    return Error{kind_, std::move(oid), what(), retriable_};
  }

private:
  ErrorKind kind_;
  std::string oid_;
  bool retriable_;
};

auto negotiation_error(const std::string &message, bool retriable) -> Error;
auto object_error(const std::string &oid, int code, const std::string &message) -> Error;
auto transfer_error(const std::string &oid, const std::string &message, bool retriable) -> Error;
auto size_mismatch(const std::string &oid, std::int64_t expected, std::int64_t actual) -> Error;
auto hash_mismatch(const std::string &oid, const std::string &actual) -> Error;
auto store_error(const std::string &oid, const std::string &message) -> Error;

} // namespace lfly
