#pragma once
// Loopback HTTP/1.1 server for tests. One connection at a time, one
// request per connection; the handler's reply is sent and the socket closed.

#include "lfly/unique_fd.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <vector>

namespace lfly::test {

struct StubRequest {
  std::string method;
  std::string target;
  std::map<std::string, std::string> headers; // names lower-cased
  std::string body;

  [[nodiscard]] std::string header(const std::string &name) const {
    const auto it = headers.find(name);
    return it == headers.end() ? std::string{} : it->second;
  }
};

struct StubReply {
  int status = 200;
  std::string reason = "OK";
  std::map<std::string, std::string> headers;
  std::string body;
  bool chunked = false;
  bool drop = false; // close without answering
};

using StubHandler = std::function<StubReply(const StubRequest &)>;

class StubServer {
public:
  explicit StubServer(StubHandler handler) : handler_{std::move(handler)} {
    listen_ = UniqueFd{::socket(AF_INET, SOCK_STREAM, 0)};
    if (!listen_) {
      throw std::runtime_error("stub: socket failed");
    }
    int yes = 1;
    ::setsockopt(listen_.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(listen_.get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
        ::listen(listen_.get(), 64) != 0) {
      throw std::runtime_error("stub: bind/listen failed");
    }
    socklen_t len = sizeof(addr);
    ::getsockname(listen_.get(), reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this] { serve(); });
  }

  ~StubServer() {
    stop_ = true;
    thread_.join();
  }

  StubServer(const StubServer &) = delete;
  StubServer &operator=(const StubServer &) = delete;

  [[nodiscard]] int port() const { return port_; }
  [[nodiscard]] std::string url(const std::string &path = "") const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  [[nodiscard]] std::vector<StubRequest> requests() const {
    std::lock_guard lock(mu_);
    return seen_;
  }
  [[nodiscard]] std::size_t request_count() const {
    std::lock_guard lock(mu_);
    return seen_.size();
  }

private:
  void serve() {
    while (!stop_) {
      pollfd pfd{listen_.get(), POLLIN, 0};
      if (::poll(&pfd, 1, 50) <= 0) {
        continue;
      }
      UniqueFd conn{::accept(listen_.get(), nullptr, nullptr)};
      if (!conn) {
        continue;
      }
      handle(conn.get());
    }
  }

  static bool read_request(int fd, StubRequest &req) {
    std::string data;
    char buf[8192];
    std::size_t head_end = std::string::npos;
    while ((head_end = data.find("\r\n\r\n")) == std::string::npos) {
      const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
      if (n <= 0) {
        return false;
      }
      data.append(buf, static_cast<std::size_t>(n));
    }
    const std::string head = data.substr(0, head_end);
    std::string rest = data.substr(head_end + 4);

    std::size_t pos = head.find("\r\n");
    const std::string request_line = head.substr(0, pos);
    const auto sp1 = request_line.find(' ');
    const auto sp2 = request_line.find(' ', sp1 + 1);
    req.method = request_line.substr(0, sp1);
    req.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    while (pos != std::string::npos && pos < head.size()) {
      const auto next = head.find("\r\n", pos + 2);
      const std::string line = head.substr(pos + 2, next == std::string::npos ? std::string::npos : next - pos - 2);
      const auto colon = line.find(':');
      if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::ranges::transform(name, name.begin(), [](unsigned char c) { return std::tolower(c); });
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(' '));
        req.headers[name] = value;
      }
      pos = next;
    }

    const auto cl = req.header("content-length");
    const std::size_t want = cl.empty() ? 0 : std::stoul(cl);
    while (rest.size() < want) {
      const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
      if (n <= 0) {
        return false;
      }
      rest.append(buf, static_cast<std::size_t>(n));
    }
    req.body = rest.substr(0, want);
    return true;
  }

  static void send_all(int fd, const std::string &s) {
    std::size_t off = 0;
    while (off < s.size()) {
      const ssize_t n = ::send(fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
      if (n <= 0) {
        return;
      }
      off += static_cast<std::size_t>(n);
    }
  }

  void handle(int fd) {
    StubRequest req;
    if (!read_request(fd, req)) {
      return;
    }
    StubReply reply;
    try {
      reply = handler_(req);
    } catch (const std::exception &e) {
      reply = StubReply{500, "Internal Server Error", {}, e.what()};
    }
    {
      std::lock_guard lock(mu_);
      seen_.push_back(req);
    }
    if (reply.drop) {
      return;
    }

    std::string out = "HTTP/1.1 " + std::to_string(reply.status) + " " + reply.reason + "\r\n";
    for (const auto &[k, v] : reply.headers) {
      out += k + ": " + v + "\r\n";
    }
    out += "Connection: close\r\n";
    if (reply.chunked) {
      out += "Transfer-Encoding: chunked\r\n\r\n";
      // split the body in a few chunks
      const std::size_t step = std::max<std::size_t>(1, reply.body.size() / 3);
      for (std::size_t off = 0; off < reply.body.size(); off += step) {
        const auto piece = reply.body.substr(off, step);
        char len[32];
        std::snprintf(len, sizeof(len), "%zx\r\n", piece.size());
        out += len + piece + "\r\n";
      }
      out += "0\r\n\r\n";
    } else {
      out += "Content-Length: " + std::to_string(reply.body.size()) + "\r\n\r\n" + reply.body;
    }
    send_all(fd, out);
  }

  StubHandler handler_;
  UniqueFd listen_;
  int port_{0};
  std::atomic<bool> stop_{false};
  std::thread thread_;
  mutable std::mutex mu_;
  std::vector<StubRequest> seen_;
};

} // namespace lfly::test
