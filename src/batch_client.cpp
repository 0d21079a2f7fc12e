#include "lfly/batch_client.hpp"

#include "lfly/consts.hpp"
#include "lfly/errors.hpp"
#include "lfly/http.hpp"
#include "lfly/trace.hpp"
#include "wire.hpp"

#include <utility>

namespace lfly {

namespace {

bool only_basic(const std::vector<std::string> &names) {
  for (const auto &n : names) {
    if (n != consts::kBasicAdapter) {
      return false;
    }
  }
  return true;
}

} // namespace

std::string encode_batch_request(const BatchRequest &req) {
  wire::BatchRequest msg;
  msg.set_operation(std::string(transfer_kind(req.operation)));
  for (const auto &o : req.objects) {
    auto *entry = msg.add_objects();
    entry->set_oid(o.oid);
    entry->set_size(static_cast<double>(o.size));
  }
  if (!only_basic(req.transfers)) {
    for (const auto &t : req.transfers) {
      msg.add_transfers(t);
    }
  }
  return wire::to_json(msg);
}

BatchResponse decode_batch_response(const std::string &body) {
  wire::BatchResponse msg;
  wire::from_json(body, msg);

  BatchResponse out;
  out.transfer = msg.transfer().empty() ? std::string(consts::kBasicAdapter) : msg.transfer();
  out.objects.reserve(msg.objects_size());
  for (const auto &r : msg.objects()) {
    NegotiatedObject obj;
    obj.oid = r.oid();
    obj.size = r.size();
    obj.authenticated = r.authenticated();
    for (const auto &[kind, a] : r.actions()) {
      Action action;
      action.href = a.href();
      action.header.insert(a.header().begin(), a.header().end());
      action.expires_at = a.expires_at();
      action.expires_in = a.expires_in();
      obj.actions.emplace(kind, std::move(action));
    }
    if (r.has_error()) {
      obj.error = ObjectError{r.error().code(), r.error().message()};
    }
    out.objects.push_back(std::move(obj));
  }
  return out;
}

HttpBatchClient::HttpBatchClient(std::string endpoint, RetryPolicy policy, int timeout_seconds,
                                 bool ssl_verify)
    : url_{endpoint.empty() ? std::string{} : http::join_url(endpoint, consts::kBatchPath)},
      policy_{std::move(policy)}, timeout_seconds_{timeout_seconds}, ssl_verify_{ssl_verify} {}

BatchResponse HttpBatchClient::negotiate(const BatchRequest &req) {
  if (req.objects.empty()) {
    return {};
  }
  if (url_.empty()) {
    throw negotiation_error("no endpoint configured", false);
  }

  http::Request hreq;
  hreq.method = "POST";
  hreq.url = url_;
  hreq.headers["Accept"] = std::string(consts::kMediaType);
  hreq.headers["Content-Type"] = std::string(consts::kMediaType);
  hreq.body = encode_batch_request(req);

  http::Options opts;
  opts.timeout_seconds = timeout_seconds_;
  opts.ssl_verify = ssl_verify_;

  http::Response res;
  try {
    res = http::perform(hreq, opts);
  } catch (const http::TransportError &e) {
    throw negotiation_error(e.what(), policy_.transport_is_retriable());
  } catch (const http::ProtocolError &e) {
    throw negotiation_error(e.what(), policy_.transport_is_retriable());
  } catch (const std::invalid_argument &e) {
    throw negotiation_error(e.what(), false);
  }

  if (!res.ok()) {
    std::string msg = "HTTP " + std::to_string(res.status);
    if (!res.reason.empty()) {
      msg += " " + res.reason;
    }
    throw negotiation_error(msg + " from " + url_, policy_.status_is_retriable(res.status));
  }

  try {
    auto out = decode_batch_response(res.body);
    trace("batch: ", transfer_kind(req.operation), " ", req.objects.size(), " object(s), ",
          out.objects.size(), " returned, transfer=", out.transfer);
    return out;
  } catch (const std::runtime_error &e) {
    throw negotiation_error(std::string("malformed response: ") + e.what(), false);
  }
}

} // namespace lfly
