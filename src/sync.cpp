#include "lfly/sync.hpp"

#include "lfly/object_store.hpp"
#include "lfly/transferable.hpp"

#include <thread>

namespace lfly {

QueueReport transfer_refs(Direction dir, const std::vector<ObjectRef> &refs,
                          const ObjectStore &store, const Settings &settings, BatchClient &client,
                          const Manifest &manifest, QueueOptions opts) {
  QueueReport report;
  TransferQueue q{dir, manifest, client, settings, opts};

  auto watcher = q.watch();
  std::thread drain([&] {
    while (auto oid = watcher->receive()) {
      report.completed.push_back(std::move(*oid));
    }
  });

  for (const auto &ref : refs) {
    try {
      if (dir == Direction::Upload) {
        q.add(Uploadable::create(store, ref.oid, ref.name));
      } else {
        q.add(Downloadable::create(store, ref.oid, ref.size, ref.name));
      }
    } catch (const Error &e) {
      report.errors.push_back(e);
    }
  }

  q.wait();
  drain.join();

  auto errs = q.errors();
  report.errors.insert(report.errors.end(), errs.begin(), errs.end());
  return report;
}

} // namespace lfly
