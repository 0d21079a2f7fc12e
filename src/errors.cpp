#include "lfly/errors.hpp"

#include <sstream>

namespace lfly {

std::string_view to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Negotiation:
    return "negotiation";
  case ErrorKind::Object:
    return "object";
  case ErrorKind::Transfer:
    return "transfer";
  case ErrorKind::SizeMismatch:
    return "size-mismatch";
  case ErrorKind::HashMismatch:
    return "hash-mismatch";
  case ErrorKind::Store:
    return "store";
  }
  return "unknown";
}

Error negotiation_error(const std::string &message, bool retriable) {
  return Error{ErrorKind::Negotiation, {}, "batch: " + message, retriable};
}

Error object_error(const std::string &oid, int code, const std::string &message) {
  std::ostringstream os;
  os << "[" << oid << "] " << message;
  if (code != 0) {
    os << " (code " << code << ")";
  }
  return Error{ErrorKind::Object, oid, os.str(), false};
}

Error transfer_error(const std::string &oid, const std::string &message, bool retriable) {
  return Error{ErrorKind::Transfer, oid, "[" + oid + "] " + message, retriable};
}

// Integrity failures end the attempt, but a fresh download may succeed.
Error size_mismatch(const std::string &oid, std::int64_t expected, std::int64_t actual) {
  std::ostringstream os;
  os << "[" << oid << "] expected " << expected << " bytes, got " << actual;
  return Error{ErrorKind::SizeMismatch, oid, os.str(), true};
}

Error hash_mismatch(const std::string &oid, const std::string &actual) {
  return Error{ErrorKind::HashMismatch, oid, "expected OID " + oid + ", got " + actual, true};
}

Error store_error(const std::string &oid, const std::string &message) {
  return Error{ErrorKind::Store, oid, "store: " + message, false};
}

} // namespace lfly
