#include "lfly/adapter.hpp"

#include "lfly/consts.hpp"
#include "lfly/trace.hpp"

#include <stdexcept>

namespace lfly {

AdapterBase::~AdapterBase() {
  // Subclasses call end() in their own destructor; this only catches leftovers.
  {
    std::lock_guard lock(mutex_);
    stop_ = true;
    jobs_.clear();
  }
  cv_.notify_all();
  for (auto &t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
}

void AdapterBase::begin(int concurrency, ProgressCallback cb, const std::atomic<bool> *cancel) {
  std::lock_guard lock(mutex_);
  if (!threads_.empty()) {
    throw std::logic_error("adapter " + name_ + " already started");
  }
  cb_ = std::move(cb);
  cancel_ = cancel;
  stop_ = false;

  const int n = concurrency < 1 ? 1 : concurrency;
  trace("xfer: adapter \"", name_, "\" Begin() with ", n, " workers");
  threads_.reserve(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    threads_.emplace_back([this, i] { worker_thread(i + 1); });
  }
}

std::shared_ptr<ResultChannel> AdapterBase::add(std::vector<Transfer> transfers) {
  auto results = std::make_shared<ResultChannel>();
  if (transfers.empty()) {
    results->close();
    return results;
  }
  auto remaining = std::make_shared<std::atomic<std::size_t>>(transfers.size());
  {
    std::lock_guard lock(mutex_);
    if (threads_.empty() || stop_) {
      throw std::logic_error("adapter " + name_ + " not started");
    }
    for (auto &t : transfers) {
      jobs_.push_back(Job{std::move(t), results, remaining});
    }
  }
  cv_.notify_all();
  return results;
}

void AdapterBase::end() {
  std::vector<std::thread> threads;
  {
    std::lock_guard lock(mutex_);
    if (threads_.empty()) {
      return;
    }
    stop_ = true;
    threads.swap(threads_);
  }
  cv_.notify_all();
  trace("xfer: adapter \"", name_, "\" End()");
  for (auto &t : threads) {
    t.join();
  }
  std::lock_guard lock(mutex_);
  stop_ = false;
}

void AdapterBase::worker_thread(int id) {
  trace("xfer: adapter \"", name_, "\" worker ", id, " starting");
  for (;;) {
    Job job;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return stop_ || !jobs_.empty(); });
      if (jobs_.empty()) {
        break;
      }
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }

    trace("xfer: adapter \"", name_, "\" worker ", id, " processing job for \"", job.transfer.oid,
          "\"");
    auto err = run_one(job.transfer);
    job.results->send(TransferResult{std::move(job.transfer), std::move(err)});
    if (job.remaining->fetch_sub(1) == 1) {
      job.results->close();
    }
  }
  trace("xfer: adapter \"", name_, "\" worker ", id, " stopping");
}

std::optional<Error> AdapterBase::run_one(const Transfer &t) {
  if (cancelled()) {
    return transfer_error(t.oid, "cancelled", true);
  }
  try {
    do_transfer(t, cb_);
    return std::nullopt;
  } catch (const Error &e) {
    return e;
  } catch (const std::exception &e) {
    return transfer_error(t.oid, e.what(), false);
  }
}

void Manifest::register_adapter(const std::string &name, Direction dir, AdapterFactory factory) {
  factories_[{dir, name}] = std::move(factory);
}

std::vector<std::string> Manifest::adapter_names(Direction dir) const {
  std::vector<std::string> names;
  if (factories_.contains({dir, std::string(consts::kBasicAdapter)})) {
    names.emplace_back(consts::kBasicAdapter);
  }
  if (basic_only_) {
    return names;
  }
  for (const auto &[key, _] : factories_) {
    if (key.first == dir && key.second != consts::kBasicAdapter) {
      names.push_back(key.second);
    }
  }
  return names;
}

std::unique_ptr<TransferAdapter> Manifest::new_adapter(std::string_view name, Direction dir) const {
  if (basic_only_ && name != consts::kBasicAdapter) {
    return nullptr;
  }
  const auto it = factories_.find({dir, std::string(name)});
  if (it == factories_.end()) {
    return nullptr;
  }
  return it->second(std::string(name), dir);
}

std::unique_ptr<TransferAdapter> Manifest::new_adapter_or_default(std::string_view name,
                                                                  Direction dir) const {
  if (!name.empty()) {
    if (auto a = new_adapter(name, dir)) {
      return a;
    }
    trace("tq: adapter \"", name, "\" not found, using basic");
  }
  if (auto a = new_adapter(consts::kBasicAdapter, dir)) {
    return a;
  }
  throw std::runtime_error("no transfer adapter available for " +
                           std::string(transfer_kind(dir)));
}

} // namespace lfly
