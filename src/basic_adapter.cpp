#include "lfly/basic_adapter.hpp"

#include "lfly/consts.hpp"
#include "lfly/http.hpp"
#include "lfly/object_store.hpp"
#include "lfly/trace.hpp"
#include "wire.hpp"

#include <fstream>
#include <stdexcept>

namespace lfly {

namespace {

// Local read failure while streaming an upload body.
class SourceReadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

http::Headers action_headers(const Action &a) {
  http::Headers h;
  for (const auto &[k, v] : a.header) {
    h[k] = v;
  }
  return h;
}

std::string status_message(const http::Response &res, std::string_view what) {
  std::string msg = std::string(what) + ": HTTP " + std::to_string(res.status);
  if (!res.reason.empty()) {
    msg += " " + res.reason;
  }
  return msg;
}

} // namespace

BasicAdapter::BasicAdapter(Direction dir, const ObjectStore &store, RetryPolicy policy,
                           int timeout_seconds, bool ssl_verify)
    : AdapterBase(std::string(consts::kBasicAdapter), dir), store_{store},
      policy_{std::move(policy)}, timeout_seconds_{timeout_seconds}, ssl_verify_{ssl_verify} {}

BasicAdapter::~BasicAdapter() { end(); }

void BasicAdapter::do_transfer(const Transfer &t, const ProgressCallback &cb) {
  try {
    if (direction() == Direction::Download) {
      download(t, cb);
    } else {
      upload(t, cb);
    }
  } catch (const http::Cancelled &) {
    throw transfer_error(t.oid, "cancelled", true);
  } catch (const http::TransportError &e) {
    throw transfer_error(t.oid, e.what(), policy_.transport_is_retriable());
  } catch (const http::ProtocolError &e) {
    throw transfer_error(t.oid, e.what(), policy_.transport_is_retriable());
  } catch (const std::invalid_argument &e) {
    throw transfer_error(t.oid, e.what(), false);
  }
}

void BasicAdapter::download(const Transfer &t, const ProgressCallback &cb) {
  if (store_.exists(t.oid, t.size)) {
    trace("xfer: ", t.oid, " already present, skipping download");
    if (cb) {
      cb(t.name, t.size, t.size, t.size);
    }
    return;
  }
  if (t.action.href.empty()) {
    throw transfer_error(t.oid, "missing download href", false);
  }

  auto writer = store_.begin_write(t.oid, t.size);

  http::Request req;
  req.url = t.action.href;
  req.headers = action_headers(t.action);

  http::Options opts = http_options();

  const auto res = http::perform(req, opts, [&](std::span<const std::uint8_t> chunk) {
    writer.write(chunk);
    if (cb) {
      cb(t.name, writer.written(), t.size, static_cast<std::int64_t>(chunk.size()));
    }
  });
  if (!res.ok()) {
    throw transfer_error(t.oid, status_message(res, "download"),
                         policy_.status_is_retriable(res.status));
  }
  writer.commit();
}

void BasicAdapter::upload(const Transfer &t, const ProgressCallback &cb) {
  if (t.action.href.empty()) {
    throw transfer_error(t.oid, "missing upload href", false);
  }
  std::ifstream in(t.path, std::ios::binary);
  if (!in) {
    throw store_error(t.oid, "cannot open " + t.path.string() + " for upload");
  }

  http::Request req;
  req.method = "PUT";
  req.url = t.action.href;
  req.headers = action_headers(t.action);
  if (!req.headers.contains("Content-Type")) {
    req.headers["Content-Type"] = "application/octet-stream";
  }
  req.content_length = t.size;
  req.source = [&in](std::uint8_t *buf, std::size_t cap) -> std::size_t {
    in.read(reinterpret_cast<char *>(buf), static_cast<std::streamsize>(cap));
    if (in.bad()) {
      throw SourceReadError("read error");
    }
    return static_cast<std::size_t>(in.gcount());
  };

  http::Options opts = http_options();
  opts.on_send = [&](std::int64_t sent, std::size_t chunk) {
    if (cb) {
      cb(t.name, sent, t.size, static_cast<std::int64_t>(chunk));
    }
  };

  http::Response res;
  try {
    res = http::perform(req, opts);
  } catch (const SourceReadError &e) {
    throw store_error(t.oid, "reading " + t.path.string() + ": " + e.what());
  }
  if (!res.ok()) {
    throw transfer_error(t.oid, status_message(res, "upload"),
                         policy_.status_is_retriable(res.status));
  }

  if (t.verify) {
    verify(t, *t.verify);
  }
}

void BasicAdapter::verify(const Transfer &t, const Action &action) {
  wire::VerifyRequest body;
  body.set_oid(t.oid);
  body.set_size(static_cast<double>(t.size));

  http::Request req;
  req.method = "POST";
  req.url = action.href;
  req.headers = action_headers(action);
  req.headers["Accept"] = std::string(consts::kMediaType);
  req.headers["Content-Type"] = std::string(consts::kMediaType);
  req.body = wire::to_json(body);

  http::Options opts = http_options();

  const auto res = http::perform(req, opts);
  if (!res.ok()) {
    throw transfer_error(t.oid, status_message(res, "verify"),
                         policy_.status_is_retriable(res.status));
  }
}

http::Options BasicAdapter::http_options() const {
  http::Options opts;
  opts.timeout_seconds = timeout_seconds_;
  opts.ssl_verify = ssl_verify_;
  opts.cancel = cancel_flag();
  return opts;
}

void register_basic_adapter(Manifest &m, const ObjectStore &store, const Settings &s) {
  const RetryPolicy policy{s};
  const int timeout = s.http_timeout;
  const bool ssl_verify = s.ssl_verify;
  for (const auto dir : {Direction::Download, Direction::Upload}) {
    m.register_adapter(std::string(consts::kBasicAdapter), dir,
                       [&store, policy, timeout, ssl_verify](const std::string &, Direction d) {
                         return std::make_unique<BasicAdapter>(d, store, policy, timeout,
                                                               ssl_verify);
                       });
  }
}

} // namespace lfly
