#pragma once
#include "lfly/adapter.hpp"
#include "lfly/api.hpp"
#include "lfly/channel.hpp"
#include "lfly/config.hpp"
#include "lfly/errors.hpp"
#include "lfly/progress.hpp"
#include "lfly/retry_counter.hpp"
#include "lfly/transferable.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lfly {

struct QueueOptions {
  // Report authorized transfers as done without running the adapter.
  bool dry_run = false;
  // Not owned; a no-op meter is used when null.
  ProgressMeter *meter = nullptr;
  // Set by the owner to stop in-flight transfers (they fail as retriable).
  const std::atomic<bool> *cancel = nullptr;
};

/**
 * Batches added objects, negotiates each batch, runs the authorized
 * transfers through the negotiated adapter and retries what can be
 * retried. Every added oid reaches exactly one final state (succeeded,
 * skipped or failed) before wait() returns.
 *
 * Usage: watch() (optional), add() any number of times, wait(), errors().
 */
class TransferQueue {
public:
  TransferQueue(Direction dir, const Manifest &manifest, BatchClient &client, Settings settings,
                QueueOptions opts = {});
  ~TransferQueue();

  TransferQueue(const TransferQueue &) = delete;
  auto operator=(const TransferQueue &) -> TransferQueue & = delete;

  // Blocks while the incoming buffer is full. A second add() of an oid is ignored.
  void add(std::shared_ptr<Transferable> t);

  // Channel of succeeded oids, in completion order; closed by wait().
  auto watch() -> std::shared_ptr<Channel<std::string>>;

  // No add() after this. Blocks until every added oid is final.
  void wait();

  // Terminal errors, one per failed oid (plus adapter start failures).
  [[nodiscard]] auto errors() const -> std::vector<Error>;

  [[nodiscard]] auto direction() const -> Direction { return direction_; }

private:
  using Batch = std::vector<std::shared_ptr<Transferable>>;

  void collect_batches();
  auto enqueue_and_collect_retries_for(Batch batch) -> Batch;
  void add_to_adapter(std::vector<Transfer> pending, Batch &next);
  void handle_transfer_result(TransferResult res, Batch &next);

  void use_adapter(const std::string &name);
  void finish_adapter();
  void ensure_adapter_begun();

  // Counts one failed attempt; true when the error and the budget both allow another.
  auto retry_after_failure(const std::string &oid, const Error &err) -> bool;
  void fail(const std::string &oid, Error err);
  void finish_one();
  auto lookup(const std::string &oid) -> std::shared_ptr<Transferable>;

  void error_collector();

  const Direction direction_;
  const Manifest &manifest_;
  BatchClient &client_;
  const Settings settings_;
  const QueueOptions opts_;
  NoopMeter noop_meter_;
  ProgressMeter *meter_;
  const std::size_t batch_size_;

  RetryCounter rc_;
  Channel<std::shared_ptr<Transferable>> incoming_;
  Channel<Error> errorc_;
  WaitGroup wait_;
  std::once_flag start_progress_;

  std::mutex tr_mutex_;
  std::map<std::string, std::shared_ptr<Transferable>> transferables_;

  std::mutex watchers_mutex_;
  std::vector<std::shared_ptr<Channel<std::string>>> watchers_;

  std::mutex adapter_mutex_;
  std::unique_ptr<TransferAdapter> adapter_;
  bool adapter_in_progress_{false};

  mutable std::mutex errors_mutex_;
  std::vector<Error> errors_;

  std::thread collector_;
  std::thread batcher_;
  bool waited_{false};
};

} // namespace lfly
