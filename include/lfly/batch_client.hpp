#pragma once
#include "lfly/api.hpp"
#include "lfly/config.hpp"

#include <string>

namespace lfly {

/**
 * BatchClient over HTTP: POST <endpoint>/objects/batch with a JSON body.
 * Transport failures, non-2xx replies and unparsable bodies become one
 * Negotiation error; the RetryPolicy decides whether it is retriable.
 */
class HttpBatchClient : public BatchClient {
public:
  HttpBatchClient(std::string endpoint, RetryPolicy policy, int timeout_seconds,
                  bool ssl_verify = true);

  auto negotiate(const BatchRequest &req) -> BatchResponse override;

  [[nodiscard]] auto batch_url() const -> const std::string & { return url_; }

private:
  std::string url_;
  RetryPolicy policy_;
  int timeout_seconds_;
  bool ssl_verify_;
};

// Request body as sent on the wire (exposed for tests).
auto encode_batch_request(const BatchRequest &req) -> std::string;
// Throws std::runtime_error on malformed JSON.
auto decode_batch_response(const std::string &body) -> BatchResponse;

} // namespace lfly
