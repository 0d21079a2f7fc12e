#pragma once
#include "lfly/hash.hpp"
#include "lfly/unique_fd.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lfly {

// Byte-copy progress: (total bytes expected, bytes so far, bytes in this chunk)
using CopyCallback = std::function<void(std::int64_t total, std::int64_t read, std::size_t chunk)>;

enum class VerifyStatus : std::uint8_t { Ok, Missing, Corrupt };

// How hard exists() looks before trusting a stored file.
enum class Check : std::uint8_t {
  Size,    // stat only
  Content, // stat + rehash
};

struct IngestResult {
  std::string oid;
  std::int64_t size = 0;
};

class ObjectStore;

/**
 * One verified write in progress. Bytes go to a unique scratch file and
 * are hashed as they arrive; commit() checks size and hash, then renames
 * the scratch file over the canonical path. Anything short of a
 * successful commit() removes the scratch file and leaves the canonical
 * path as it was.
 */
class ObjectWriter {
public:
  ObjectWriter(ObjectWriter &&) noexcept;
  auto operator=(ObjectWriter &&) noexcept -> ObjectWriter &;
  ObjectWriter(const ObjectWriter &) = delete;
  auto operator=(const ObjectWriter &) -> ObjectWriter & = delete;
  ~ObjectWriter();

  void write(std::span<const std::uint8_t> data);

  [[nodiscard]] auto written() const noexcept -> std::int64_t { return written_; }
  [[nodiscard]] auto temp_path() const -> const std::filesystem::path & { return tmp_; }

  // Verify and publish. Returns the oid (computed when the writer was opened without one).
  // Throws SizeMismatch, HashMismatch or Store errors.
  auto commit() -> std::string;

  // Drop the scratch file. Safe to call more than once.
  void discard() noexcept;

private:
  friend class ObjectStore;
  ObjectWriter(const ObjectStore &store, std::string oid, std::int64_t expected_size,
               std::filesystem::path tmp, UniqueFd fd);

  const ObjectStore *store_;
  std::string oid_;            // empty: content-defined (ingest)
  std::int64_t expected_size_; // -1: unknown
  std::filesystem::path tmp_;
  UniqueFd fd_;
  std::unique_ptr<Sha256> hasher_;
  std::int64_t written_{0};
  bool done_{false};
};

/**
 * Content-addressable object store rooted at <repo>/.lfly:
 *   objects/aa/bb/aabb...   published objects
 *   tmp/                    scratch files (same volume, for atomic rename)
 *   bad/                    quarantined corrupt objects
 */
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path root) : root_(std::move(root)) {}

  [[nodiscard]] static auto for_repo(const std::filesystem::path &repo_root) -> ObjectStore;

  [[nodiscard]] auto root() const -> const std::filesystem::path & { return root_; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path;
  [[nodiscard]] auto tmp_dir() const -> std::filesystem::path;
  [[nodiscard]] auto bad_dir() const -> std::filesystem::path;

  // Canonical path for an oid; creates the fanout directories. Throws Store errors.
  [[nodiscard]] auto path_for(std::string_view oid) const -> std::filesystem::path;
  // Same path, no directory creation.
  [[nodiscard]] auto path_for_read_only(std::string_view oid) const -> std::filesystem::path;

  // True only if the object is present with the declared size (and, for
  // Check::Content, the right hash). A stale or corrupt file is removed.
  [[nodiscard]] auto exists(std::string_view oid, std::int64_t size,
                            Check check = Check::Size) const -> bool;

  [[nodiscard]] auto begin_write(std::string_view oid, std::int64_t size) const -> ObjectWriter;

  // Stream `in` into the store under `oid`, verifying size and hash.
  void write_verified(std::string_view oid, std::istream &in, std::int64_t size,
                      const CopyCallback &cb = {}) const;

  // Hash `in` while copying it into the store; the content defines the oid (clean).
  [[nodiscard]] auto ingest(std::istream &in, const CopyCallback &cb = {}) const -> IngestResult;
  // Same, for content whose first bytes were already read from `rest`.
  [[nodiscard]] auto ingest(std::span<const std::uint8_t> prefix, std::istream &rest,
                            const CopyCallback &cb = {}) const -> IngestResult;

  // Rehash a stored object.
  [[nodiscard]] auto verify(std::string_view oid) const -> VerifyStatus;

  // Move a stored object to bad/<oid>; returns the new location.
  auto quarantine(std::string_view oid) const -> std::filesystem::path;

  // All oids currently published, sorted.
  [[nodiscard]] auto list() const -> std::vector<std::string>;

  // Hash a file on disk: {oid, size}
  [[nodiscard]] static auto hash_file(const std::filesystem::path &p) -> IngestResult;

private:
  [[nodiscard]] auto open_temp(std::string_view oid) const -> std::pair<std::filesystem::path, UniqueFd>;

  std::filesystem::path root_;
};

} // namespace lfly
