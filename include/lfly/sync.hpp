#pragma once
#include "lfly/adapter.hpp"
#include "lfly/api.hpp"
#include "lfly/config.hpp"
#include "lfly/errors.hpp"
#include "lfly/transfer_queue.hpp"
#include "lfly/worktree.hpp"

#include <string>
#include <vector>

namespace lfly {

class ObjectStore;

struct QueueReport {
  std::vector<std::string> completed; // oids, completion order
  std::vector<Error> errors;
};

// Run one queue over `refs` and wait for it.
auto transfer_refs(Direction dir, const std::vector<ObjectRef> &refs, const ObjectStore &store,
                   const Settings &settings, BatchClient &client, const Manifest &manifest,
                   QueueOptions opts = {}) -> QueueReport;

} // namespace lfly
