#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lfly {

enum class Direction : std::uint8_t { Upload, Download };

// "upload" | "download": the batch operation and the action key the queue looks for
auto transfer_kind(Direction dir) -> std::string_view;

// Server-issued authorization for one transfer.
struct Action {
  std::string href;
  std::map<std::string, std::string> header;
  std::string expires_at;      // RFC 3339, may be empty
  std::int64_t expires_in = 0; // seconds, 0 when absent
};

struct ObjectError {
  int code = 0;
  std::string message;
};

// One object as the server sees it after negotiation.
struct NegotiatedObject {
  std::string oid;
  std::int64_t size = 0;
  bool authenticated = false;
  std::map<std::string, Action> actions;
  std::optional<ObjectError> error;

  // Action for a transfer kind; absent means the transfer is not needed.
  [[nodiscard]] auto rel(std::string_view kind) const -> const Action * {
    const auto it = actions.find(std::string(kind));
    return it == actions.end() ? nullptr : &it->second;
  }
};

struct ObjectSpec {
  std::string oid;
  std::int64_t size = 0;
};

struct BatchRequest {
  Direction operation = Direction::Download;
  std::vector<ObjectSpec> objects;
  std::vector<std::string> transfers; // adapter names offered by the client
};

struct BatchResponse {
  std::string transfer; // adapter chosen by the server; empty means "basic"
  std::vector<NegotiatedObject> objects;
};

/**
 * Negotiation endpoint. One call per batch; results are correlated by oid,
 * not by position. Failures of the call as a whole are thrown as
 * lfly::Error of kind Negotiation with the retriable flag already decided.
 * Implementations must not touch the local store.
 */
class BatchClient {
public:
  virtual ~BatchClient() = default;
  virtual auto negotiate(const BatchRequest &req) -> BatchResponse = 0;
};

} // namespace lfly
