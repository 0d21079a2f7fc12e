#pragma once
#include "lfly/api.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace lfly {

class ObjectStore;

/**
 * One object the queue can move. Identity is the oid: two transferables
 * with the same oid are the same transfer. name() is for display only.
 */
class Transferable {
public:
  virtual ~Transferable() = default;

  [[nodiscard]] virtual auto oid() const -> const std::string & = 0;
  [[nodiscard]] virtual auto size() const -> std::int64_t = 0;
  [[nodiscard]] virtual auto name() const -> const std::string & = 0;
  [[nodiscard]] virtual auto path() const -> const std::filesystem::path & = 0;

  // Last negotiation result for this object (set by the queue).
  [[nodiscard]] auto object() const -> std::optional<NegotiatedObject> {
    std::lock_guard lock(mu_);
    return object_;
  }
  void set_object(NegotiatedObject o) {
    std::lock_guard lock(mu_);
    object_ = std::move(o);
  }

private:
  mutable std::mutex mu_;
  std::optional<NegotiatedObject> object_;
};

// Common storage for the two concrete transferables.
class StoredTransferable : public Transferable {
public:
  [[nodiscard]] auto oid() const -> const std::string & override { return oid_; }
  [[nodiscard]] auto size() const -> std::int64_t override { return size_; }
  [[nodiscard]] auto name() const -> const std::string & override { return name_; }
  [[nodiscard]] auto path() const -> const std::filesystem::path & override { return path_; }

protected:
  StoredTransferable(std::string oid, std::int64_t size, std::string name,
                     std::filesystem::path path)
      : oid_{std::move(oid)}, size_{size}, name_{std::move(name)}, path_{std::move(path)} {}

private:
  const std::string oid_;
  const std::int64_t size_;
  const std::string name_;
  const std::filesystem::path path_;
};

// A stored object to send. Size comes from the file in the store.
class Uploadable : public StoredTransferable {
public:
  // Throws a Store error when the object is not in the store.
  static auto create(const ObjectStore &store, const std::string &oid, const std::string &name)
      -> std::shared_ptr<Uploadable>;

private:
  using StoredTransferable::StoredTransferable;
};

// An object to fetch into the store at its canonical path.
class Downloadable : public StoredTransferable {
public:
  static auto create(const ObjectStore &store, const std::string &oid, std::int64_t size,
                     const std::string &name) -> std::shared_ptr<Downloadable>;

private:
  using StoredTransferable::StoredTransferable;
};

} // namespace lfly
