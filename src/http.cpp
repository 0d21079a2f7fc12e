#include "lfly/http.hpp"

#include "lfly/fs.hpp"
#include "lfly/trace.hpp"
#include "lfly/unique_fd.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <netdb.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <system_error>
#include <vector>

namespace {

using lfly::UniqueFd;
using lfly::http::Cancelled;
using lfly::http::ProtocolError;
using lfly::http::TransportError;

std::string lower(std::string_view s) {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

[[nodiscard]] auto sys_error(std::string_view where, int err) -> TransportError {
  return TransportError(std::string(where) + ": " + std::generic_category().message(err));
}

[[nodiscard]] auto gai_error(int rc, std::string_view host, int port) -> TransportError {
  std::ostringstream os;
  os << "getaddrinfo failed for " << host << ":" << port << ": " << gai_strerror(rc);
  return TransportError(os.str());
}

void set_timeouts(int fd, int seconds) {
  timeval tv{};
  tv.tv_sec = seconds;
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// Non-blocking connect bounded by `timeout_seconds`, then back to blocking mode.
[[nodiscard]] auto connect_one(const addrinfo *rp, int timeout_seconds) -> UniqueFd {
  UniqueFd fd{::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol)};
  if (!fd) {
    return {};
  }
  const int flags = ::fcntl(fd.get(), F_GETFL, 0);
  ::fcntl(fd.get(), F_SETFL, flags | O_NONBLOCK);

  if (::connect(fd.get(), rp->ai_addr, rp->ai_addrlen) != 0) {
    if (errno != EINPROGRESS) {
      return {};
    }
    pollfd pfd{.fd = fd.get(), .events = POLLOUT, .revents = 0};
    const int rc = ::poll(&pfd, 1, timeout_seconds * 1000);
    if (rc <= 0) {
      errno = rc == 0 ? ETIMEDOUT : errno;
      return {};
    }
    int soerr = 0;
    socklen_t len = sizeof(soerr);
    if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &soerr, &len) != 0 || soerr != 0) {
      errno = soerr != 0 ? soerr : errno;
      return {};
    }
  }
  ::fcntl(fd.get(), F_SETFL, flags);
  set_timeouts(fd.get(), timeout_seconds);
  return fd;
}

[[nodiscard]] auto connect_tcp(const std::string &host, int port, int timeout_seconds) -> UniqueFd {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *res = nullptr;
  const std::string port_s = std::to_string(port);
  if (const int rc = ::getaddrinfo(host.c_str(), port_s.c_str(), &hints, &res); rc != 0) {
    throw gai_error(rc, host, port);
  }

  UniqueFd sock;
  int last_errno = ECONNREFUSED;
  for (addrinfo *rp = res; rp != nullptr; rp = rp->ai_next) {
    sock = connect_one(rp, timeout_seconds);
    if (sock) {
      break;
    }
    last_errno = errno;
  }
  ::freeaddrinfo(res);

  if (!sock) {
    throw sys_error("connect " + host + ":" + port_s, last_errno);
  }
  return sock;
}

struct SslCtxDeleter {
  void operator()(SSL_CTX *ctx) const noexcept { SSL_CTX_free(ctx); }
};
struct SslDeleter {
  void operator()(SSL *ssl) const noexcept { SSL_free(ssl); }
};

std::unique_ptr<SSL_CTX, SslCtxDeleter> make_client_ctx(bool verify) {
  std::unique_ptr<SSL_CTX, SslCtxDeleter> c{SSL_CTX_new(TLS_client_method())};
  if (!c) {
    throw TransportError("SSL_CTX_new failed");
  }
  SSL_CTX_set_min_proto_version(c.get(), TLS1_2_VERSION);
  if (!verify) {
    SSL_CTX_set_verify(c.get(), SSL_VERIFY_NONE, nullptr);
    return c;
  }
  SSL_CTX_set_verify(c.get(), SSL_VERIFY_PEER, nullptr);
  if (SSL_CTX_set_default_verify_paths(c.get()) != 1) {
    throw TransportError("cannot load default CA certificates");
  }
  return c;
}

SSL_CTX *client_ctx(bool verify) {
  static const auto verifying = make_client_ctx(true);
  static const auto trusting = make_client_ctx(false);
  return verify ? verifying.get() : trusting.get();
}

std::string ssl_error_text() {
  const unsigned long e = ERR_get_error();
  if (e == 0) {
    return "unknown TLS error";
  }
  char buf[256];
  ERR_error_string_n(e, buf, sizeof(buf));
  return buf;
}

// A connected socket, optionally wrapped in TLS, with a small read buffer.
class Connection {
public:
  Connection(const lfly::http::Url &url, const lfly::http::Options &opts)
      : fd_{connect_tcp(url.host, url.port, opts.timeout_seconds)}, cancel_{opts.cancel} {
    if (url.scheme == "https") {
      ssl_.reset(SSL_new(client_ctx(opts.ssl_verify)));
      if (!ssl_) {
        throw TransportError("SSL_new failed");
      }
      SSL_set_tlsext_host_name(ssl_.get(), url.host.c_str());
      if (opts.ssl_verify) {
        SSL_set1_host(ssl_.get(), url.host.c_str());
      }
      SSL_set_fd(ssl_.get(), fd_.get());
      if (SSL_connect(ssl_.get()) != 1) {
        throw TransportError("TLS handshake with " + url.host + " failed: " + ssl_error_text());
      }
    }
  }

  void send_all(const void *buf, std::size_t n) {
    const auto *p = static_cast<const std::uint8_t *>(buf);
    while (n != 0U) {
      check_cancel();
      ssize_t w = 0;
      if (ssl_) {
        w = SSL_write(ssl_.get(), p, static_cast<int>(std::min<std::size_t>(n, 1 << 30)));
        if (w <= 0) {
          throw TransportError("TLS write failed: " + ssl_error_text());
        }
      } else {
        w = ::send(fd_.get(), p, n, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) {
          continue;
        }
        if (w <= 0) {
          throw errno == EAGAIN ? TransportError("send: timed out") : sys_error("send", errno);
        }
      }
      p += static_cast<std::size_t>(w);
      n -= static_cast<std::size_t>(w);
    }
  }

  void send_all(std::string_view s) { send_all(s.data(), s.size()); }

  // Up to `cap` bytes; 0 at end of stream.
  auto read_some(std::uint8_t *dst, std::size_t cap) -> std::size_t {
    if (pos_ < buf_.size()) {
      const std::size_t n = std::min(cap, buf_.size() - pos_);
      std::memcpy(dst, buf_.data() + pos_, n);
      pos_ += n;
      return n;
    }
    return raw_read(dst, cap);
  }

  void read_exact(std::uint8_t *dst, std::size_t n) {
    std::size_t got = 0;
    while (got < n) {
      const std::size_t r = read_some(dst + got, n - got);
      if (r == 0) {
        throw TransportError("connection closed mid-body");
      }
      got += r;
    }
  }

  [[nodiscard]] auto read_line() -> std::string {
    std::string s;
    for (;;) {
      if (pos_ == buf_.size()) {
        buf_.resize(8192);
        const std::size_t r = raw_read(buf_.data(), buf_.size());
        buf_.resize(r);
        pos_ = 0;
        if (r == 0) {
          throw ProtocolError("connection closed while reading headers");
        }
      }
      const auto begin = buf_.begin() + static_cast<std::ptrdiff_t>(pos_);
      const auto nl = std::find(begin, buf_.end(), static_cast<std::uint8_t>('\n'));
      s.append(begin, nl);
      if (nl != buf_.end()) {
        pos_ = static_cast<std::size_t>(nl - buf_.begin()) + 1;
        break;
      }
      pos_ = buf_.size();
      if (s.size() > 64 * 1024) {
        throw ProtocolError("header line too long");
      }
    }
    if (!s.empty() && s.back() == '\r') {
      s.pop_back();
    }
    return s;
  }

private:
  void check_cancel() const {
    if (cancel_ != nullptr && cancel_->load()) {
      throw Cancelled();
    }
  }

  auto raw_read(std::uint8_t *dst, std::size_t cap) -> std::size_t {
    check_cancel();
    for (;;) {
      if (ssl_) {
        const int r = SSL_read(ssl_.get(), dst, static_cast<int>(std::min<std::size_t>(cap, 1 << 30)));
        if (r > 0) {
          return static_cast<std::size_t>(r);
        }
        const int err = SSL_get_error(ssl_.get(), r);
        if (err == SSL_ERROR_ZERO_RETURN) {
          return 0;
        }
        if (err == SSL_ERROR_SYSCALL && errno == 0) {
          return 0; // peer closed without close_notify
        }
        throw TransportError("TLS read failed: " + ssl_error_text());
      }
      const ssize_t r = ::recv(fd_.get(), dst, cap, 0);
      if (r >= 0) {
        return static_cast<std::size_t>(r);
      }
      if (errno == EINTR) {
        continue;
      }
      throw errno == EAGAIN ? TransportError("recv: timed out") : sys_error("recv", errno);
    }
  }

  UniqueFd fd_;
  std::unique_ptr<SSL, SslDeleter> ssl_;
  const std::atomic<bool> *cancel_;
  std::vector<std::uint8_t> buf_;
  std::size_t pos_{0};
};

std::int64_t parse_length(std::string_view sv, int base) {
  std::int64_t v = 0;
  const auto *end = sv.data() + sv.size();
  auto [p, ec] = std::from_chars(sv.data(), end, v, base);
  if (ec != std::errc{} || p == sv.data() || v < 0) {
    throw ProtocolError("bad length '" + std::string(sv) + "'");
  }
  return v;
}

// Stream a body of known length, chunked encoding, or until EOF into `out`.
template <typename Out>
void read_body(Connection &conn, const lfly::http::Response &res, Out &&out) {
  std::vector<std::uint8_t> buf(32 * 1024);
  if (lower(res.header("transfer-encoding")).find("chunked") != std::string::npos) {
    for (;;) {
      std::string line = conn.read_line();
      const auto semi = line.find(';');
      const std::int64_t n = parse_length(trim(line.substr(0, semi)), 16);
      if (n == 0) {
        // trailers until the blank line
        while (!conn.read_line().empty()) {
        }
        return;
      }
      std::int64_t left = n;
      while (left > 0) {
        const auto want = static_cast<std::size_t>(std::min<std::int64_t>(left, buf.size()));
        conn.read_exact(buf.data(), want);
        out(std::span<const std::uint8_t>(buf.data(), want));
        left -= static_cast<std::int64_t>(want);
      }
      if (!conn.read_line().empty()) {
        throw ProtocolError("missing CRLF after chunk");
      }
    }
  }

  const std::string cl = res.header("content-length");
  if (!cl.empty()) {
    std::int64_t left = parse_length(trim(cl), 10);
    while (left > 0) {
      const auto want = static_cast<std::size_t>(std::min<std::int64_t>(left, buf.size()));
      conn.read_exact(buf.data(), want);
      out(std::span<const std::uint8_t>(buf.data(), want));
      left -= static_cast<std::int64_t>(want);
    }
    return;
  }

  for (;;) {
    const std::size_t r = conn.read_some(buf.data(), buf.size());
    if (r == 0) {
      return;
    }
    out(std::span<const std::uint8_t>(buf.data(), r));
  }
}

void send_request(Connection &conn, const lfly::http::Url &url, const lfly::http::Request &req,
                  bool buffered, const lfly::http::Options &opts) {
  const bool default_port =
      (url.scheme == "http" && url.port == 80) || (url.scheme == "https" && url.port == 443);

  std::ostringstream head;
  head << req.method << ' ' << url.target << " HTTP/1.1\r\n";
  head << "Host: " << url.host;
  if (!default_port) {
    head << ':' << url.port;
  }
  head << "\r\n";
  head << "User-Agent: lfly/0.1\r\n";
  head << "Connection: close\r\n";
  if (buffered) {
    head << "Accept-Encoding: gzip\r\n";
  }
  const std::int64_t length =
      req.source ? req.content_length : static_cast<std::int64_t>(req.body.size());
  if (req.source || !req.body.empty() || req.method == "POST" || req.method == "PUT") {
    head << "Content-Length: " << length << "\r\n";
  }
  for (const auto &[k, v] : req.headers) {
    head << k << ": " << v << "\r\n";
  }
  head << "\r\n";
  conn.send_all(head.str());

  if (!req.source) {
    conn.send_all(req.body);
    return;
  }
  std::vector<std::uint8_t> buf(32 * 1024);
  std::int64_t sent = 0;
  for (;;) {
    const std::size_t n = req.source(buf.data(), buf.size());
    if (n == 0) {
      break;
    }
    conn.send_all(buf.data(), n);
    sent += static_cast<std::int64_t>(n);
    if (opts.on_send) {
      opts.on_send(sent, n);
    }
  }
  if (sent != length) {
    throw TransportError("request body was " + std::to_string(sent) + " bytes, declared " +
                         std::to_string(length));
  }
}

lfly::http::Response read_head(Connection &conn) {
  lfly::http::Response res;
  for (;;) {
    const std::string status_line = conn.read_line();
    // "HTTP/1.1 200 OK"
    if (!status_line.starts_with("HTTP/1.")) {
      throw ProtocolError("malformed status line '" + status_line + "'");
    }
    const auto sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || status_line.size() < sp1 + 4) {
      throw ProtocolError("malformed status line '" + status_line + "'");
    }
    res.status = static_cast<int>(parse_length(std::string_view(status_line).substr(sp1 + 1, 3), 10));
    res.reason = status_line.size() > sp1 + 5 ? status_line.substr(sp1 + 5) : std::string{};
    res.headers.clear();

    for (std::string line = conn.read_line(); !line.empty(); line = conn.read_line()) {
      const auto colon = line.find(':');
      if (colon == std::string::npos) {
        throw ProtocolError("malformed header line '" + line + "'");
      }
      res.headers[lower(trim(std::string_view(line).substr(0, colon)))] =
          trim(std::string_view(line).substr(colon + 1));
    }
    // skip interim 1xx responses
    if (res.status >= 200 || res.status == 101) {
      return res;
    }
  }
}

bool is_redirect(int status) {
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

void erase_header(lfly::http::Headers &headers, std::string_view name) {
  std::erase_if(headers, [&](const auto &kv) { return lower(kv.first) == name; });
}

// 307/308 resend the same body, which a one-shot source cannot do.
bool can_follow(int status, const lfly::http::Request &req) {
  return (status != 307 && status != 308) || !req.source;
}

// Rewrite `req` for the hop to `next`; `origin` is where the first request went.
void prepare_redirect(lfly::http::Request &req, int status, const lfly::http::Url &origin,
                      const lfly::http::Url &next) {
  if ((status == 301 || status == 302 || status == 303) && req.method != "HEAD" &&
      req.method != "GET") {
    req.method = "GET";
    req.body.clear();
    req.source = nullptr;
    req.content_length = -1;
    erase_header(req.headers, "content-type");
    erase_header(req.headers, "content-length");
  }
  if (next.scheme != origin.scheme || lower(next.host) != lower(origin.host) ||
      next.port != origin.port) {
    erase_header(req.headers, "authorization");
  }
}

lfly::http::Response read_rest(Connection &conn, const lfly::http::Request &req,
                               lfly::http::Response res, const lfly::http::BodySink &sink) {
  if (req.method == "HEAD" || res.status == 204 || res.status == 304) {
    return res;
  }

  if (sink && res.ok()) {
    read_body(conn, res, sink);
    return res;
  }

  std::vector<std::uint8_t> raw;
  read_body(conn, res, [&](std::span<const std::uint8_t> chunk) {
    raw.insert(raw.end(), chunk.begin(), chunk.end());
  });
  if (lower(res.header("content-encoding")) == "gzip") {
    try {
      res.body = lfly::fs::z_gunzip(raw);
    } catch (const std::runtime_error &e) {
      throw ProtocolError(std::string("gzip body: ") + e.what());
    }
  } else {
    res.body.assign(raw.begin(), raw.end());
  }
  return res;
}

} // namespace

namespace lfly::http {

std::string Response::header(std::string_view name) const {
  const auto it = headers.find(lower(name));
  return it == headers.end() ? std::string{} : it->second;
}

Url parse_url(std::string_view url) {
  Url out;
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) {
    throw std::invalid_argument("url: missing scheme in '" + std::string(url) + "'");
  }
  out.scheme = lower(url.substr(0, scheme_end));
  if (out.scheme != "http" && out.scheme != "https") {
    throw std::invalid_argument("url: unsupported scheme '" + out.scheme + "'");
  }
  std::string_view rest = url.substr(scheme_end + 3);
  const auto slash = rest.find('/');
  std::string_view authority = rest.substr(0, slash);
  out.target = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));
  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority.remove_prefix(at + 1); // credentials are not ours to handle
  }

  out.port = out.scheme == "https" ? 443 : 80;
  std::string_view host = authority;
  if (authority.starts_with('[')) {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      throw std::invalid_argument("url: bad IPv6 host in '" + std::string(url) + "'");
    }
    host = authority.substr(1, close - 1);
    authority.remove_prefix(close + 1);
    if (authority.starts_with(':')) {
      out.port = static_cast<int>(parse_length(authority.substr(1), 10));
    }
  } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    try {
      out.port = static_cast<int>(parse_length(authority.substr(colon + 1), 10));
    } catch (const ProtocolError &) {
      throw std::invalid_argument("url: bad port in '" + std::string(url) + "'");
    }
  }
  if (host.empty()) {
    throw std::invalid_argument("url: missing host in '" + std::string(url) + "'");
  }
  out.host = std::string(host);
  return out;
}

std::string join_url(std::string_view base, std::string_view path) {
  std::string out(base);
  while (!out.empty() && out.back() == '/') {
    out.pop_back();
  }
  while (!path.empty() && path.front() == '/') {
    path.remove_prefix(1);
  }
  out.push_back('/');
  out.append(path);
  return out;
}

std::string resolve_location(const Url &base, std::string_view location) {
  const auto sep = location.find("://");
  if (sep != std::string_view::npos && location.substr(0, sep).find_first_of("/?#") == std::string_view::npos) {
    return std::string(location);
  }
  if (location.starts_with("//")) {
    return base.scheme + ":" + std::string(location);
  }

  std::string origin = base.scheme + "://";
  origin += base.host.find(':') == std::string::npos ? base.host : "[" + base.host + "]";
  const bool default_port =
      (base.scheme == "http" && base.port == 80) || (base.scheme == "https" && base.port == 443);
  if (!default_port) {
    origin += ":" + std::to_string(base.port);
  }
  if (location.starts_with('/')) {
    return origin + std::string(location);
  }
  // relative to the directory of the current path
  std::string dir = base.target.substr(0, base.target.find('?'));
  dir.erase(dir.rfind('/') + 1);
  return origin + dir + std::string(location);
}

Response perform(const Request &req, const Options &opts, const BodySink &sink) {
  const Url origin = parse_url(req.url);
  Request cur = req;
  Url url = origin;

  for (int hop = 0;; ++hop) {
    trace("http: ", cur.method, " ", url.scheme, "://", url.host, ":", url.port, url.target);
    Connection conn{url, opts};
    send_request(conn, url, cur, !sink, opts);
    Response res = read_head(conn);
    trace("http: ", res.status, " ", res.reason);

    const std::string location = res.header("location");
    if (!is_redirect(res.status) || location.empty() || !can_follow(res.status, cur)) {
      return read_rest(conn, cur, std::move(res), sink);
    }
    if (hop >= opts.max_redirects) {
      throw ProtocolError("stopped after " + std::to_string(opts.max_redirects) +
                          " redirects from " + req.url);
    }
    cur.url = resolve_location(url, location);
    Url next = parse_url(cur.url);
    prepare_redirect(cur, res.status, origin, next);
    trace("http: redirected to ", cur.url);
    url = std::move(next);
  }
}

} // namespace lfly::http
