#pragma once
#include "lfly/adapter.hpp"
#include "lfly/config.hpp"
#include "lfly/http.hpp"

namespace lfly {

class ObjectStore;
class Manifest;

/**
 * "basic" transfers: a plain HTTP GET of the download href streamed
 * through an ObjectWriter, or a PUT of the stored file to the upload href
 * followed by an optional POST to the verify href.
 */
class BasicAdapter final : public AdapterBase {
public:
  BasicAdapter(Direction dir, const ObjectStore &store, RetryPolicy policy, int timeout_seconds,
               bool ssl_verify = true);
  ~BasicAdapter() override;

protected:
  void do_transfer(const Transfer &t, const ProgressCallback &cb) override;

private:
  void download(const Transfer &t, const ProgressCallback &cb);
  void upload(const Transfer &t, const ProgressCallback &cb);
  void verify(const Transfer &t, const Action &action);
  [[nodiscard]] auto http_options() const -> http::Options;

  const ObjectStore &store_;
  RetryPolicy policy_;
  int timeout_seconds_;
  bool ssl_verify_;
};

// Registers "basic" for both directions.
void register_basic_adapter(Manifest &m, const ObjectStore &store, const Settings &s);

} // namespace lfly
