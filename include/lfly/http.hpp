#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lfly::http {

// Could not talk to the server: resolve/connect/send/recv failure or timeout.
class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The owner asked in-flight work to stop.
class Cancelled : public TransportError {
public:
  Cancelled() : TransportError("cancelled") {}
};

// The server answered with something that is not HTTP/1.x.
class ProtocolError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct Url {
  std::string scheme; // "http" | "https"
  std::string host;
  int port = 0;
  std::string target; // path + query, at least "/"
};

// Throws std::invalid_argument for anything but http(s)://host[:port][/path]
Url parse_url(std::string_view url);

// "https://h/repo/info/lfs" + "objects/batch" -> "https://h/repo/info/lfs/objects/batch"
std::string join_url(std::string_view base, std::string_view path);

using Headers = std::map<std::string, std::string>;

// Fills `buf` with up to `cap` request body bytes; 0 ends the body.
using BodySource = std::function<std::size_t(std::uint8_t *buf, std::size_t cap)>;
// Receives response body bytes as they arrive.
using BodySink = std::function<void(std::span<const std::uint8_t>)>;

struct Request {
  std::string method = "GET";
  std::string url;
  Headers headers;
  std::string body;               // sent when `source` is empty
  BodySource source;              // streamed body; needs content_length
  std::int64_t content_length = -1;
};

struct Response {
  int status = 0;
  std::string reason;
  Headers headers; // names lower-cased
  std::string body;

  [[nodiscard]] auto header(std::string_view name) const -> std::string;
  [[nodiscard]] auto ok() const -> bool { return status >= 200 && status < 300; }
};

struct Options {
  int timeout_seconds = 30;
  const std::atomic<bool> *cancel = nullptr;
  // false skips certificate and host name checks on https
  bool ssl_verify = true;
  // redirects followed per request; one more is a ProtocolError
  int max_redirects = 3;
  // (bytes sent, chunk) while the request body goes out
  std::function<void(std::int64_t, std::size_t)> on_send;
};

// Where a Location header sends a request made to `base`.
std::string resolve_location(const Url &base, std::string_view location);

/**
 * One request per connection (Connection: close).
 * Redirects are followed up to Options::max_redirects: 301/302/303 turn
 * any method but HEAD into a bodiless GET, 307/308 repeat the request
 * unless its body was streamed from a source. Authorization is dropped
 * when the redirect leaves the original scheme, host or port.
 * With a `sink`, a final 2xx body is streamed into it; any other body is
 * buffered into Response::body (gzip-inflated when the server compressed it).
 * Throws TransportError / Cancelled / ProtocolError.
 */
Response perform(const Request &req, const Options &opts, const BodySink &sink = {});

} // namespace lfly::http
