#include "lfly/transfer_queue.hpp"

#include "lfly/consts.hpp"
#include "lfly/trace.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace lfly {

TransferQueue::TransferQueue(Direction dir, const Manifest &manifest, BatchClient &client,
                             Settings settings, QueueOptions opts)
    : direction_{dir}, manifest_{manifest}, client_{client}, settings_{std::move(settings)},
      opts_{opts}, meter_{opts.meter != nullptr ? opts.meter : &noop_meter_},
      batch_size_{static_cast<std::size_t>(std::max(1, settings_.batch_size))},
      rc_{settings_.max_attempts},
      incoming_{static_cast<std::size_t>(std::max(1, settings_.effective_buffer_depth()))} {
  trace("tq: running as batched queue, batch size of ", batch_size_);
  collector_ = std::thread([this] { error_collector(); });
  batcher_ = std::thread([this] { collect_batches(); });
}

TransferQueue::~TransferQueue() {
  if (!waited_) {
    wait();
  }
}

void TransferQueue::add(std::shared_ptr<Transferable> t) {
  {
    std::lock_guard lock(tr_mutex_);
    if (!transferables_.emplace(t->oid(), t).second) {
      trace("tq: already transferring \"", t->oid(), "\", skipping duplicate");
      return;
    }
    wait_.add(1);
  }
  meter_->add(t->size());
  incoming_.send(std::move(t));
}

std::shared_ptr<Channel<std::string>> TransferQueue::watch() {
  auto c = std::make_shared<Channel<std::string>>();
  std::lock_guard lock(watchers_mutex_);
  watchers_.push_back(c);
  return c;
}

void TransferQueue::wait() {
  if (waited_) {
    return;
  }
  waited_ = true;
  incoming_.close();

  wait_.wait();
  batcher_.join();

  finish_adapter();
  errorc_.close();
  {
    std::lock_guard lock(watchers_mutex_);
    for (auto &w : watchers_) {
      w->close();
    }
  }
  meter_->finish();
  collector_.join();
}

std::vector<Error> TransferQueue::errors() const {
  std::lock_guard lock(errors_mutex_);
  return errors_;
}

// Fill a batch from the incoming channel (retries from the previous round
// first), negotiate it, transfer it, and carry its retries into the next
// round. Ends once the channel is closed and a round leaves no retries.
void TransferQueue::collect_batches() {
  bool closing = false;
  Batch batch;

  for (;;) {
    while (!closing && batch.size() < batch_size_) {
      auto t = incoming_.receive();
      if (!t) {
        closing = true;
        break;
      }
      batch.push_back(std::move(*t));
    }

    std::ranges::stable_sort(batch, [](const auto &a, const auto &b) {
      return a->size() > b->size();
    });

    Batch retries = enqueue_and_collect_retries_for(std::move(batch));
    if (closing && retries.empty()) {
      break;
    }
    batch = std::move(retries);
  }
}

TransferQueue::Batch TransferQueue::enqueue_and_collect_retries_for(Batch batch) {
  Batch next;
  if (batch.empty()) {
    return next;
  }

  BatchRequest req;
  req.operation = direction_;
  req.transfers = manifest_.adapter_names(direction_);
  req.objects.reserve(batch.size());
  for (const auto &t : batch) {
    req.objects.push_back(ObjectSpec{t->oid(), t->size()});
  }

  trace("tq: sending batch of size ", batch.size());

  BatchResponse res;
  std::optional<Error> failure;
  try {
    res = client_.negotiate(req);
  } catch (const Error &err) {
    failure = err;
  } catch (const std::exception &e) {
    failure = negotiation_error(e.what(), false);
  }
  if (failure) {
    trace("tq: batch failed: ", failure->what());
    for (auto &t : batch) {
      if (retry_after_failure(t->oid(), *failure)) {
        next.push_back(std::move(t));
      } else {
        fail(t->oid(), failure->for_object(t->oid()));
      }
    }
    return next;
  }

  std::call_once(start_progress_, [this] { meter_->start(); });

  const std::string_view kind = transfer_kind(direction_);
  std::map<std::string, std::shared_ptr<Transferable>> pending;
  for (const auto &t : batch) {
    pending.emplace(t->oid(), t);
  }

  std::vector<Transfer> to_transfer;
  to_transfer.reserve(batch.size());

  for (auto &o : res.objects) {
    const auto it = pending.find(o.oid);
    if (it == pending.end()) {
      trace("tq: ignoring unexpected object \"", o.oid, "\" in batch response");
      continue;
    }
    auto t = it->second;
    pending.erase(it);

    if (o.error) {
      fail(o.oid, object_error(o.oid, o.error->code, o.error->message));
      meter_->skip(t->size());
      continue;
    }

    const Action *action = o.rel(kind);
    if (action == nullptr) {
      meter_->skip(t->size());
      finish_one();
      continue;
    }

    Transfer xfer;
    xfer.name = t->name();
    xfer.oid = t->oid();
    xfer.size = o.size > 0 ? o.size : t->size();
    xfer.path = t->path();
    xfer.action = *action;
    if (direction_ == Direction::Upload) {
      if (const Action *v = o.rel(consts::kVerify)) {
        xfer.verify = *v;
      }
    }
    t->set_object(std::move(o));
    to_transfer.push_back(std::move(xfer));
  }

  // Everything the server left out of its answer.
  for (const auto &t : batch) {
    if (pending.contains(t->oid())) {
      fail(t->oid(), object_error(t->oid(), 0, "missing from batch response"));
      meter_->skip(t->size());
    }
  }

  // Keep dispatch largest-first regardless of response order.
  std::ranges::stable_sort(to_transfer, [](const Transfer &a, const Transfer &b) {
    return a.size > b.size;
  });

  if (!to_transfer.empty()) {
    if (!opts_.dry_run) {
      try {
        use_adapter(res.transfer);
        ensure_adapter_begun();
      } catch (const std::exception &e) {
        errorc_.send(transfer_error({}, std::string("cannot start transfer adapter: ") + e.what(),
                                    false));
        for (const auto &x : to_transfer) {
          meter_->skip(x.size);
          finish_one();
        }
        return next;
      }
    }
    add_to_adapter(std::move(to_transfer), next);
  }
  return next;
}

void TransferQueue::add_to_adapter(std::vector<Transfer> pending, Batch &next) {
  for (const auto &x : pending) {
    meter_->start_transfer(x.name);
  }

  if (opts_.dry_run) {
    for (auto &x : pending) {
      handle_transfer_result(TransferResult{std::move(x), std::nullopt}, next);
    }
    return;
  }

  std::shared_ptr<ResultChannel> results;
  {
    std::lock_guard lock(adapter_mutex_);
    results = adapter_->add(std::move(pending));
  }
  while (auto res = results->receive()) {
    handle_transfer_result(std::move(*res), next);
  }
}

void TransferQueue::handle_transfer_result(TransferResult res, Batch &next) {
  const std::string &oid = res.transfer.oid;

  if (res.error) {
    if (retry_after_failure(oid, *res.error)) {
      if (auto t = lookup(oid)) {
        trace("tq: enqueue retry #", rc_.count_for(oid), " for \"", oid,
              "\" (size: ", t->size(), ")");
        next.push_back(std::move(t));
        return;
      }
    }
    fail(oid, std::move(*res.error));
    return;
  }

  {
    std::lock_guard lock(watchers_mutex_);
    for (auto &w : watchers_) {
      w->send(oid);
    }
  }
  meter_->finish_transfer(res.transfer.name);
  finish_one();
}

void TransferQueue::use_adapter(const std::string &name) {
  std::lock_guard lock(adapter_mutex_);
  if (adapter_) {
    if (adapter_->name() == name ||
        (name.empty() && adapter_->name() == consts::kBasicAdapter)) {
      return;
    }
    // The server switched adapters between batches.
    trace("tq: switching adapter \"", adapter_->name(), "\" -> \"", name, "\"");
    if (adapter_in_progress_) {
      adapter_->end();
      adapter_in_progress_ = false;
    }
    adapter_.reset();
  }
  adapter_ = manifest_.new_adapter_or_default(name, direction_);
}

void TransferQueue::finish_adapter() {
  std::lock_guard lock(adapter_mutex_);
  if (adapter_ && adapter_in_progress_) {
    adapter_->end();
    adapter_in_progress_ = false;
  }
  adapter_.reset();
}

void TransferQueue::ensure_adapter_begun() {
  std::lock_guard lock(adapter_mutex_);
  if (adapter_in_progress_) {
    return;
  }
  const std::string_view kind = transfer_kind(direction_);
  auto cb = [this, kind](const std::string &name, std::int64_t read, std::int64_t total,
                         std::int64_t current) {
    meter_->transfer_bytes(kind, name, read, total, current);
  };

  trace("tq: starting transfer adapter \"", adapter_->name(), "\"");
  adapter_->begin(settings_.concurrent_transfers, cb, opts_.cancel);
  adapter_in_progress_ = true;
}

bool TransferQueue::retry_after_failure(const std::string &oid, const Error &err) {
  rc_.increment(oid);
  const auto [count, ok] = rc_.can_retry(oid);
  if (!ok) {
    trace("tq: refusing to retry \"", oid, "\", too many retries (", count, ")");
    return false;
  }
  return err.retriable();
}

void TransferQueue::fail(const std::string &oid, Error err) {
  trace("tq: ", oid, " failed: ", err.what());
  errorc_.send(std::move(err));
  finish_one();
}

void TransferQueue::finish_one() { wait_.done(); }

std::shared_ptr<Transferable> TransferQueue::lookup(const std::string &oid) {
  std::lock_guard lock(tr_mutex_);
  const auto it = transferables_.find(oid);
  return it == transferables_.end() ? nullptr : it->second;
}

void TransferQueue::error_collector() {
  while (auto err = errorc_.receive()) {
    std::lock_guard lock(errors_mutex_);
    errors_.push_back(std::move(*err));
  }
}

} // namespace lfly
