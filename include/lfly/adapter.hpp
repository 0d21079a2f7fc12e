#pragma once
#include "lfly/api.hpp"
#include "lfly/channel.hpp"
#include "lfly/errors.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace lfly {

// One authorized transfer handed to an adapter.
struct Transfer {
  std::string name;
  std::string oid;
  std::int64_t size = 0;
  std::filesystem::path path;
  Action action;
  std::optional<Action> verify; // upload only: POST {oid,size} here afterwards
};

struct TransferResult {
  Transfer transfer;
  std::optional<Error> error;
};

using ResultChannel = Channel<TransferResult>;

// (name, bytes so far, total, bytes in this chunk)
using ProgressCallback =
    std::function<void(const std::string &name, std::int64_t read, std::int64_t total,
                       std::int64_t current)>;

/**
 * A way of moving bytes for one direction. begin() starts the workers,
 * add() enqueues transfers and returns a channel carrying exactly one
 * result per transfer (closed after the last one), end() drains and
 * joins. begin() may be called again after end().
 */
class TransferAdapter {
public:
  virtual ~TransferAdapter() = default;

  [[nodiscard]] virtual auto name() const -> const std::string & = 0;
  [[nodiscard]] virtual auto direction() const -> Direction = 0;

  virtual void begin(int concurrency, ProgressCallback cb, const std::atomic<bool> *cancel) = 0;
  virtual auto add(std::vector<Transfer> transfers) -> std::shared_ptr<ResultChannel> = 0;
  virtual void end() = 0;
};

/**
 * Worker pool shared by concrete adapters. Subclasses implement
 * do_transfer() for a single object; any exception it throws becomes the
 * error of that object's result.
 */
class AdapterBase : public TransferAdapter {
public:
  AdapterBase(std::string name, Direction dir) : name_{std::move(name)}, direction_{dir} {}
  ~AdapterBase() override;

  AdapterBase(const AdapterBase &) = delete;
  auto operator=(const AdapterBase &) -> AdapterBase & = delete;

  [[nodiscard]] auto name() const -> const std::string & override { return name_; }
  [[nodiscard]] auto direction() const -> Direction override { return direction_; }

  void begin(int concurrency, ProgressCallback cb, const std::atomic<bool> *cancel) override;
  auto add(std::vector<Transfer> transfers) -> std::shared_ptr<ResultChannel> override;
  void end() override;

protected:
  // Move one object. Throw lfly::Error (or anything std::exception) on failure.
  virtual void do_transfer(const Transfer &t, const ProgressCallback &cb) = 0;

  [[nodiscard]] auto cancelled() const -> bool { return cancel_ != nullptr && cancel_->load(); }
  [[nodiscard]] auto cancel_flag() const -> const std::atomic<bool> * { return cancel_; }

private:
  struct Job {
    Transfer transfer;
    std::shared_ptr<ResultChannel> results;
    std::shared_ptr<std::atomic<std::size_t>> remaining;
  };

  void worker_thread(int id);
  auto run_one(const Transfer &t) -> std::optional<Error>;

  const std::string name_;
  const Direction direction_;

  ProgressCallback cb_;
  const std::atomic<bool> *cancel_{nullptr};

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool stop_{false};
  std::vector<std::thread> threads_;
};

using AdapterFactory = std::function<std::unique_ptr<TransferAdapter>(const std::string &name, Direction dir)>;

/**
 * Adapters available to a queue, by name and direction. The queue offers
 * adapter_names() to the server and builds whichever one it picks.
 */
class Manifest {
public:
  explicit Manifest(bool basic_transfers_only = false)
      : basic_only_{basic_transfers_only} {}

  void register_adapter(const std::string &name, Direction dir, AdapterFactory factory);

  // Names offered for negotiation; "basic" first when registered.
  [[nodiscard]] auto adapter_names(Direction dir) const -> std::vector<std::string>;

  // nullptr when no adapter of that name exists for the direction
  [[nodiscard]] auto new_adapter(std::string_view name, Direction dir) const
      -> std::unique_ptr<TransferAdapter>;

  // Falls back to "basic" for an empty or unknown name. Throws when basic is missing too.
  [[nodiscard]] auto new_adapter_or_default(std::string_view name, Direction dir) const
      -> std::unique_ptr<TransferAdapter>;

private:
  bool basic_only_;
  std::map<std::pair<Direction, std::string>, AdapterFactory> factories_;
};

} // namespace lfly
