#include "lfly/basic_adapter.hpp"
#include "lfly/batch_client.hpp"
#include "lfly/hash.hpp"
#include "lfly/object_store.hpp"
#include "lfly/sync.hpp"
#include "support/stub_server.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::string oid_of(const std::string &s) { return lfly::to_hex(lfly::sha256(s)); }

lfly::Transfer transfer_for(const std::string &oid, std::int64_t size, const std::string &href,
                            const lfly::ObjectStore &store) {
  lfly::Transfer t;
  t.name = "file-" + oid.substr(0, 6);
  t.oid = oid;
  t.size = size;
  t.path = store.path_for_read_only(oid);
  t.action.href = href;
  t.action.header["Authorization"] = "Bearer t0k";
  return t;
}

std::vector<lfly::TransferResult> run(lfly::BasicAdapter &adapter, std::vector<lfly::Transfer> ts) {
  adapter.begin(2, {}, nullptr);
  auto ch = adapter.add(std::move(ts));
  std::vector<lfly::TransferResult> out;
  while (auto r = ch->receive())
    out.push_back(std::move(*r));
  adapter.end();
  return out;
}

// In-memory object server: PUT stores, GET serves, POST /verify checks,
// POST .../objects/batch answers with hrefs back to this server.
struct Remote {
  std::mutex mu;
  std::map<std::string, std::string> objects; // oid -> bytes
  std::map<std::string, int> get_count;
  int verify_calls = 0;
  int blob_gets = 0;
  std::string base;

  lfly::test::StubReply operator()(const lfly::test::StubRequest &req) {
    std::lock_guard lock(mu);
    lfly::test::StubReply r;
    if (req.header("authorization") != "Bearer t0k" && req.target.rfind("/objects/", 0) == 0) {
      r.status = 401;
      r.reason = "Unauthorized";
      return r;
    }
    if (req.target == "/lfs/objects/batch") {
      const bool upload = req.body.find("\"operation\":\"upload\"") != std::string::npos;
      std::string out = R"({"transfer":"basic","objects":[)";
      std::size_t pos = 0;
      bool first = true;
      while ((pos = req.body.find("\"oid\":\"", pos)) != std::string::npos) {
        const std::string oid = req.body.substr(pos + 7, 64);
        pos += 7;
        const auto sz_at = req.body.find("\"size\":", pos) + 7;
        const std::string size = req.body.substr(sz_at, req.body.find_first_of(",}", sz_at) - sz_at);
        out += first ? "" : ",";
        first = false;
        out += R"({"oid":")" + oid + R"(","size":)" + size;
        const bool have = objects.contains(oid);
        if (upload && !have) {
          out += R"(,"actions":{"upload":{"href":")" + base + "/objects/" + oid +
                 R"(","header":{"Authorization":"Bearer t0k"}},"verify":{"href":")" + base +
                 R"(/verify","header":{"Authorization":"Bearer t0k"}}})";
        } else if (!upload && have) {
          out += R"(,"actions":{"download":{"href":")" + base + "/objects/" + oid +
                 R"(","header":{"Authorization":"Bearer t0k"}}})";
        } else if (!upload) {
          out += R"(,"error":{"code":404,"message":"Object does not exist"})";
        }
        out += "}";
      }
      out += "]}";
      r.body = out;
      return r;
    }
    if (req.target == "/verify") {
      ++verify_calls;
      const auto oid = req.body.substr(req.body.find("\"oid\":\"") + 7, 64);
      if (!objects.contains(oid)) {
        r.status = 422;
        r.reason = "Unprocessable";
      }
      return r;
    }
    if (req.target.rfind("/objects/", 0) == 0) {
      const auto oid = req.target.substr(9);
      if (req.method == "PUT") {
        objects[oid] = req.body;
        return r;
      }
      ++get_count[oid];
      const auto it = objects.find(oid);
      if (it == objects.end()) {
        r.status = 404;
        r.reason = "Not Found";
        return r;
      }
      r.body = it->second;
      r.chunked = it->second.size() > 1000;
      return r;
    }
    // object storage behind a redirect, no credentials needed there
    if (req.target.rfind("/redirect/", 0) == 0) {
      r.status = 307;
      r.reason = "Temporary Redirect";
      r.headers["Location"] = base + "/blob/" + req.target.substr(10);
      return r;
    }
    if (req.target.rfind("/blob/", 0) == 0) {
      ++blob_gets;
      const auto it = objects.find(req.target.substr(6));
      if (it == objects.end()) {
        r.status = 404;
        r.reason = "Not Found";
        return r;
      }
      r.body = it->second;
      return r;
    }
    if (req.target == "/flaky") {
      r.status = 503;
      r.reason = "Service Unavailable";
      return r;
    }
    r.status = 404;
    r.reason = "Not Found";
    return r;
  }
};

} // namespace

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("lfly_basic_adapter_" + std::to_string(std::random_device{}()));
  const fs::path other = root.string() + "_clone";
  fs::create_directories(root);
  fs::create_directories(other);

  int rc = 0;
  try {
    Remote remote;
    lfly::test::StubServer server([&](const lfly::test::StubRequest &req) { return remote(req); });
    remote.base = server.url();

    const auto store = lfly::ObjectStore::for_repo(root);
    lfly::Settings settings;
    const lfly::RetryPolicy policy{settings};

    const std::string small = "small object\n";
    const std::string large(50000, 'L');
    remote.objects[oid_of(small)] = small;
    remote.objects[oid_of(large)] = large;

    // downloads, including one the server sends chunked
    {
      lfly::BasicAdapter adapter{lfly::Direction::Download, store, policy, 5};
      auto results = run(adapter, {transfer_for(oid_of(small), static_cast<std::int64_t>(small.size()),
                                                server.url("/objects/" + oid_of(small)), store),
                                   transfer_for(oid_of(large), static_cast<std::int64_t>(large.size()),
                                                server.url("/objects/" + oid_of(large)), store)});
      if (results.size() != 2) {
        std::cerr << "expected 2 results, got " << results.size() << "\n";
        return 1;
      }
      for (const auto &r : results) {
        if (r.error) {
          std::cerr << "download failed: " << r.error->what() << "\n";
          return 1;
        }
      }
      if (!store.exists(oid_of(small), static_cast<std::int64_t>(small.size()), lfly::Check::Content) ||
          !store.exists(oid_of(large), static_cast<std::int64_t>(large.size()), lfly::Check::Content)) {
        std::cerr << "downloaded objects not stored\n";
        return 1;
      }
    }

    // already present: no request
    {
      const auto before = remote.get_count[oid_of(small)];
      lfly::BasicAdapter adapter{lfly::Direction::Download, store, policy, 5};
      auto results = run(adapter, {transfer_for(oid_of(small), static_cast<std::int64_t>(small.size()),
                                                server.url("/objects/" + oid_of(small)), store)});
      if (results.size() != 1 || results[0].error || remote.get_count[oid_of(small)] != before) {
        std::cerr << "present object downloaded again\n";
        return 1;
      }
    }

    // wrong bytes from the server: retriable hash mismatch, nothing stored
    {
      const std::string liar = oid_of("what the pointer says");
      remote.objects[liar] = "what the server sends!";
      lfly::BasicAdapter adapter{lfly::Direction::Download, store, policy, 5};
      auto results = run(adapter, {transfer_for(liar, 22, server.url("/objects/" + liar), store)});
      if (!results[0].error || results[0].error->kind() != lfly::ErrorKind::HashMismatch ||
          !results[0].error->retriable() || fs::exists(store.path_for_read_only(liar))) {
        std::cerr << "hash mismatch not reported\n";
        return 1;
      }
    }

    // HTTP errors classified by the policy
    {
      const std::string gone = oid_of("gone");
      lfly::BasicAdapter adapter{lfly::Direction::Download, store, policy, 5};
      auto results = run(adapter, {transfer_for(gone, 4, server.url("/objects/" + gone), store),
                                   transfer_for(oid_of("flaky"), 5, server.url("/flaky"), store)});
      for (const auto &r : results) {
        const bool want_retry = r.transfer.oid == oid_of("flaky");
        if (!r.error || r.error->kind() != lfly::ErrorKind::Transfer || r.error->retriable() != want_retry) {
          std::cerr << "status classification for " << r.transfer.oid << "\n";
          return 1;
        }
      }
    }

    // download href answering 307: the object comes from the Location
    {
      const std::string moved = "stored somewhere else\n";
      const auto oid = oid_of(moved);
      remote.objects[oid] = moved;
      lfly::BasicAdapter adapter{lfly::Direction::Download, store, policy, 5};
      auto results = run(adapter, {transfer_for(oid, static_cast<std::int64_t>(moved.size()),
                                                server.url("/redirect/" + oid), store)});
      if (results.size() != 1 || results[0].error) {
        std::cerr << "redirected download failed: "
                  << (results.empty() || !results[0].error ? "no result" : results[0].error->what()) << "\n";
        return 1;
      }
      if (remote.blob_gets != 1 ||
          !store.exists(oid, static_cast<std::int64_t>(moved.size()), lfly::Check::Content)) {
        std::cerr << "redirected object not stored\n";
        return 1;
      }
    }

    // end to end: push from one store, fetch into another
    {
      const std::string payload(20000, 'p');
      std::istringstream in(payload);
      const auto ingested = store.ingest(in);

      settings.endpoint = server.url("/lfs");
      lfly::HttpBatchClient client{settings.endpoint, lfly::RetryPolicy{settings}, 5};

      lfly::Manifest manifest{settings.basic_transfers_only};
      lfly::register_basic_adapter(manifest, store, settings);
      const std::vector<lfly::ObjectRef> refs{{ingested.oid, ingested.size, "big.bin"},
                                              {oid_of(small), static_cast<std::int64_t>(small.size()), "small.txt"}};
      const auto pushed = lfly::transfer_refs(lfly::Direction::Upload, refs, store, settings, client, manifest);
      if (!pushed.errors.empty() || pushed.completed != std::vector<std::string>{ingested.oid}) {
        for (const auto &e : pushed.errors)
          std::cerr << "push error: " << e.what() << "\n";
        std::cerr << "push outcome: " << pushed.completed.size() << " completed\n";
        return 1;
      }
      if (remote.objects[ingested.oid] != payload || remote.verify_calls != 1) {
        std::cerr << "server did not receive a verified upload\n";
        return 1;
      }

      const auto clone = lfly::ObjectStore::for_repo(other);
      lfly::Manifest clone_manifest;
      lfly::register_basic_adapter(clone_manifest, clone, settings);
      auto wanted = refs;
      wanted.push_back({oid_of("never uploaded"), 3, "ghost"});
      const auto fetched = lfly::transfer_refs(lfly::Direction::Download, wanted, clone, settings, client, clone_manifest);
      if (fetched.completed.size() != 2 || fetched.errors.size() != 1 ||
          fetched.errors[0].kind() != lfly::ErrorKind::Object ||
          !clone.exists(ingested.oid, ingested.size, lfly::Check::Content)) {
        std::cerr << "fetch outcome: " << fetched.completed.size() << " completed, "
                  << fetched.errors.size() << " errors\n";
        return 1;
      }
    }

    std::cout << "basic adapter OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  fs::remove_all(other, ec);
  return rc;
}
